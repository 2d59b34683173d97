/* this project is part of the Bazinga project; licensed under the MIT license. see LICENSE for more info */

#pragma once

#include <cstdint>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <bazinga/foundation/analysis-pass.hpp>

namespace bzg
{
    class Text;

    /**
     * @brief Context for pass execution, storing analysis results and statistics.
     *
     * Results are cached per pass type and tagged with the text revision they
     * were computed at; once the text is rewritten, by a pass or directly,
     * they read as absent.
     */
    class PassContext
    {
    public:
        /**
         * @brief Creates a context for the given text.
         * @param text The text being processed.
         * @param debug_mode Whether debug information is enabled.
         */
        explicit PassContext(Text& text, bool debug_mode = false);

        /**
         * @brief Returns the text being processed.
         * @return Reference to the text.
         */
        Text& text();
        [[nodiscard]] const Text& text() const;

        /**
         * @brief Checks if debug mode is enabled.
         * @return True if debug mode is enabled, false otherwise.
         */
        [[nodiscard]] bool debug_mode() const;

        /**
         * @brief Stores an analysis result for the current text revision.
         */
        void store_result(const std::type_info& pass_type,
                         std::unique_ptr<AnalysisResult> result);

        /**
         * @brief Gets a result for a specific pass type.
         * @tparam ResultT The type of result to get.
         * @param pass_type Type information for the pass.
         * @return Pointer to the result, or nullptr if not found.
         */
        template<typename ResultT>
        [[nodiscard]] const ResultT* get_result(const std::type_info& pass_type) const
        {
            const auto* cached = find_current(pass_type);
            if (!cached)
                return nullptr;
            return dynamic_cast<const ResultT*>(cached);
        }

        /**
         * @brief Gets the result stored by a pass type.
         * @tparam PassT The analysis pass that produced the result.
         * @tparam ResultT The type of result to get.
         * @return Pointer to the result, or nullptr if not found.
         */
        template<typename PassT, typename ResultT>
        [[nodiscard]] const ResultT* get_result() const
        {
            return get_result<ResultT>(typeid(PassT));
        }

        /**
         * @return True if a result for `pass_type` exists and matches the current text.
         */
        [[nodiscard]] bool has_result(const std::type_info& pass_type) const;

        /**
         * @brief Invalidates the result for a specific pass.
         * @param pass_type Type information for the pass.
         */
        void invalidate(const std::type_info& pass_type);

        /**
         * @brief Invalidates results affected by a transform pass.
         * @param invalidating_pass Type information for the invalidating pass.
         */
        void invalidate_by(const std::type_info& invalidating_pass);

        /**
         * @brief Updates a statistic value.
         * @param name The name of the statistic.
         * @param delta The amount to add to the statistic.
         */
        void update_stat(std::string_view name, std::size_t delta);

        /**
         * @brief Gets a statistic value.
         * @param name The name of the statistic.
         * @return The statistic value, or 0 if not found.
         */
        [[nodiscard]] std::size_t get_stat(std::string_view name) const;

    private:
        struct CachedResult
        {
            std::unique_ptr<AnalysisResult> result;
            std::uint64_t revision = 0;
        };

        [[nodiscard]] const AnalysisResult* find_current(const std::type_info& pass_type) const;

        Text& txt;
        bool dbg_mode;

        std::unordered_map<std::type_index, CachedResult> res;
        std::unordered_map<std::string, std::size_t> stats;
    };
}
