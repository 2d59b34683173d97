/* this project is part of the Bazinga project; licensed under the MIT license. see LICENSE for more info */

#include <bazinga/foundation/analysis-pass.hpp>
#include <bazinga/foundation/pass-context.hpp>

namespace bzg
{
	bool AnalysisPass::run(Text& text, PassContext& context)
	{
		auto result = analyze(text, context);
		if (!result)
			return false;

		context.store_result(bzg_id(), std::move(result));
		return true;
	}
}
