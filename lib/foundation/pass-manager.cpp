/* this project is part of the Bazinga project; licensed under the MIT license. see LICENSE for more info */

#include <format>
#include <iostream>
#include <stdexcept>
#include <bazinga/foundation/pass-manager.hpp>

namespace bzg
{
    PassManager::PassManager(Text &text, const bool debug_mode, const int verbosity)
        : txt(text), verbosity_lvl(verbosity), ctx(text, debug_mode) {}

    void PassManager::register_pass(std::unique_ptr<Pass> pass)
    {
        const auto type_idx = std::type_index(pass->bzg_id());
        if (passes.contains(type_idx))
        {
            throw std::runtime_error(
                std::format("pass {} already registered", pass->name()));
        }

        /* get deps */
        PassInfo info;
        for (const auto *req: pass->required_passes())
            info.required.emplace_back(*req);

        info.invalidated = pass->invalidated_passes();

        info.pass = std::move(pass); /* transfer ownership */
        passes.emplace(type_idx, std::move(info));
        pass_order.push_back(type_idx);
    }

    bool PassManager::run_pass(const std::type_info &pass_type)
    {
        const auto type_idx = std::type_index(pass_type);
        const auto it = passes.find(type_idx);
        if (it == passes.end())
        {
            throw std::runtime_error(
                std::format("pass {} not found", pass_type.name()));
        }

        auto &[pass, required, invalidated] = it->second;

        /* run any required passes first */
        for (const auto &req: required)
        {
            const auto req_it = passes.find(req);
            if (req_it == passes.end())
            {
                throw std::runtime_error(
                    std::format("required pass {} of {} not found", req.name(), pass->name()));
            }

            const auto &req_type = req_it->second.pass->bzg_id();
            if (ctx.has_result(req_type))
                continue; /* cached analysis is still valid */

            if (!run_pass(req_type))
                return false;
        }

        const auto start = std::chrono::high_resolution_clock::now();
        const bool success = pass->run(txt, ctx);
        const auto end = std::chrono::high_resolution_clock::now();

        /* record timing information */
        const auto duration = std::chrono::duration<double>(end - start).count();
        pass_times[type_idx] += duration;
        ++pass_runs[type_idx];

        /* output progress information based on verbosity */
        if (verbosity_lvl > 0)
        {
            std::cout << std::format("pass {} completed in {:.2f}ms ({})\n",
                                     pass->name(),
                                     duration * 1000,
                                     success ? "success" : "failure");
        }

        if (verbosity_lvl > 1)
        {
            std::cout << std::format("  text '{}' is now {} bytes (revision {})\n",
                                     txt.get_name(), txt.size(), txt.revision());
        }

        if (success)
        {
            for (const auto *inv: invalidated)
                ctx.invalidate(*inv);
            ctx.invalidate_by(pass_type);
        }

        return success;
    }

    bool PassManager::run_all()
    {
        /* run passes in the order they were added */
        for (const auto &type_idx: pass_order)
        {
            const auto it = passes.find(type_idx);
            if (it == passes.end())
            {
                throw std::runtime_error(
                    std::format("pass {} not found in execution order", type_idx.name()));
            }

            if (!run_pass(it->second.pass->bzg_id()))
                return false;
        }

        return true;
    }

    PassContext &PassManager::get_context()
    {
        return ctx;
    }

    const PassContext &PassManager::get_context() const
    {
        return ctx;
    }

    void PassManager::set_verbosity(const int level)
    {
        verbosity_lvl = level;
    }

    void PassManager::print_statistics(std::ostream &os) const
    {
        if (pass_times.empty())
        {
            os << std::format("no passes have run on '{}'\n", txt.get_name());
            return;
        }

        auto total_time = 0.0;
        std::size_t total_runs = 0;
        for (const auto &idx: pass_order)
        {
            if (const auto it = pass_times.find(idx); it != pass_times.end())
                total_time += it->second;
            if (const auto it = pass_runs.find(idx); it != pass_runs.end())
                total_runs += it->second;
        }

        os << std::format("'{}': {} pass runs in {:.3f}ms\n",
                          txt.get_name(), total_runs, total_time * 1000);

        /* registration order, passes that never ran are left out */
        for (const auto &idx: pass_order)
        {
            const auto time_it = pass_times.find(idx);
            if (time_it == pass_times.end())
                continue;

            os << std::format("  {:<28} {:>4}x {:>10.3f}ms\n",
                              passes.at(idx).pass->name(),
                              pass_runs.at(idx),
                              time_it->second * 1000);
        }
    }
}
