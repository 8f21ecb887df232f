#include <sarfile/errors.hxx>

#include <fmt/format.h>

#include <utility>

namespace sarfile {
SourceReadFailure::SourceReadFailure(std::string member, const std::string &what)
    : Error(fmt::format("cannot read source of member '{}': {}", member, what)),
      member_(std::move(member)) {}
} // namespace sarfile
