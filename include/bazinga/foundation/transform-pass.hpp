/* this project is part of the Bazinga project; licensed under the MIT license. see LICENSE for more info */

#pragma once

#include <bazinga/foundation/pass.hpp>

namespace bzg
{
	/**
	 * @brief Base class for passes that rewrite the text.
	 *
	 * A successful transform invalidates every cached analysis result that
	 * reports itself as invalidated by it.
	 */
	class TransformPass : public Pass {};
}
