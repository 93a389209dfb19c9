#pragma once
#include <funcclock/core/events/probe_event.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace FuncClock {

/**
 * @class FunctionFilter
 * @brief Glob include/exclude list over function ids ("lib!symbol")
 *
 * Exclusion wins over inclusion. An empty include list accepts everything
 * that is not excluded.
 */
class FunctionFilter {
public:
    FunctionFilter() = default;
    FunctionFilter(std::vector<std::string> include, std::vector<std::string> exclude);

    bool accepts(const FunctionId& function_id) const;

    bool empty() const { return include_.empty() && exclude_.empty(); }
    const std::vector<std::string>& includePatterns() const { return include_; }
    const std::vector<std::string>& excludePatterns() const { return exclude_; }

    static bool globMatch(const std::string& pattern, const std::string& text);

    // PLT stubs and OpenMP outlined bodies. perf rewrites '@' and '.' in
    // probe names to '_', so "puts@plt" arrives as "puts_plt".
    static std::vector<std::string> defaultExcludes() {
        return {"*@plt", "*_plt", "*_omp_fn*"};
    }

private:
    std::vector<std::string> include_;
    std::vector<std::string> exclude_;
};

} // namespace FuncClock
