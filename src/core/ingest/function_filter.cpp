#include <funcclock/core/ingest/function_filter.hpp>
#include <algorithm>
#include <fnmatch.h>

namespace FuncClock {

FunctionFilter::FunctionFilter(std::vector<std::string> include, std::vector<std::string> exclude)
    : include_(std::move(include)), exclude_(std::move(exclude)) {}

bool FunctionFilter::globMatch(const std::string& pattern, const std::string& text) {
    return ::fnmatch(pattern.c_str(), text.c_str(), 0) == 0;
}

bool FunctionFilter::accepts(const FunctionId& function_id) const {
    auto matches = [&function_id](const std::string& p) { return globMatch(p, function_id); };

    if (std::any_of(exclude_.begin(), exclude_.end(), matches)) return false;
    if (include_.empty()) return true;
    return std::any_of(include_.begin(), include_.end(), matches);
}

} // namespace FuncClock
