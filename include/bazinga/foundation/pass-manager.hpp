/* this project is part of the Bazinga project; licensed under the MIT license. see LICENSE for more info */

#pragma once

#include <chrono>
#include <iostream>
#include <memory>
#include <typeindex>
#include <unordered_map>
#include <vector>
#include <bazinga/foundation/pass-context.hpp>
#include <bazinga/foundation/pass.hpp>

namespace bzg
{
    /**
     * @brief Manages pass registration and execution.
     *
     * The PassManager is responsible for registering passes,
     * tracking dependencies between passes, executing passes
     * in the correct order, and collecting and reporting
     * statistics.
     */
    class PassManager
    {
    public:
        /**
         * @brief Creates a pass manager for the given text with specified options.
         * @param text The text to operate on.
         * @param debug_mode Whether debug information is enabled.
         * @param verbosity Level of output detail (0=minimal, 1=normal, 2=verbose).
         */
        explicit PassManager(Text& text, bool debug_mode = false, int verbosity = 0);

        /**
         * @brief Registers a pass constructed in place.
         * @tparam PassT The type of pass to register.
         * @tparam Args Types of arguments to forward to the pass constructor.
         * @param args Arguments to forward to the pass constructor.
         * @throws std::runtime_error if the pass is already registered.
         */
        template<typename PassT, typename... Args>
        void add_pass(Args&&... args)
        {
            register_pass(std::make_unique<PassT>(std::forward<Args>(args)...));
        }

        /**
         * @brief Registers a pass instance.
         * @tparam PassT The type of pass to register.
         * @param pass The pass to register.
         * @throws std::runtime_error if the pass is already registered.
         */
        template<typename PassT>
        void add_pass(std::unique_ptr<PassT> pass)
        {
            register_pass(std::move(pass));
        }

        /**
         * @brief Runs a specific pass.
         *
         * Required passes run first unless their analysis result is still cached.
         *
         * @param pass_type Type information for the pass to run.
         * @return True if the pass succeeded, false otherwise.
         * @throws std::runtime_error if the pass or one of its requirements is not registered.
         */
        bool run_pass(const std::type_info& pass_type);

        /**
         * @brief Runs a pass by type.
         * @tparam PassT The type of pass to run.
         * @return True if the pass succeeded, false otherwise.
         */
        template<typename PassT>
        bool run_pass()
        {
            return run_pass(typeid(PassT));
        }

        /**
         * @brief Runs all registered passes in the order they were added.
         * @return True if all passes succeeded, false otherwise.
         */
        bool run_all();

        /**
         * @brief Gets the pass context.
         * @return Reference to the pass context.
         */
        PassContext& get_context();
        [[nodiscard]] const PassContext& get_context() const;

        /**
         * @brief Sets the verbosity level.
         * @param level The verbosity level.
         */
        void set_verbosity(int level);

        /**
         * @brief Prints how often and how long each pass ran, in registration order.
         */
        void print_statistics(std::ostream& os = std::cout) const;

    private:
        /**
         * @brief Information about a registered pass.
         */
        struct PassInfo
        {
            std::unique_ptr<Pass> pass;
            std::vector<std::type_index> required;
            std::vector<const std::type_info*> invalidated;
        };

        void register_pass(std::unique_ptr<Pass> pass);

        Text& txt;
        int verbosity_lvl = 0;
        PassContext ctx;

        std::unordered_map<std::type_index, PassInfo> passes;
        std::unordered_map<std::type_index, double> pass_times;
        std::unordered_map<std::type_index, std::size_t> pass_runs;
        std::vector<std::type_index> pass_order;
    };
}
