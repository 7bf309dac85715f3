#include "search/filter.hpp"

#include <string>
#include <string_view>
#include <vector>

#include <range/v3/range/conversion.hpp>
#include <range/v3/view/filter.hpp>

#include "misc/tools.hpp"
#include "xdcc/size.hpp"

namespace xdcc::search {

Filter::Filter(std::string_view expression) :
  _expression(utils::trim(expression))
{
    if (_expression.empty()) {
        return;
    }

    const auto head = _expression.front();

    if (head == '>' or head == '<') {
        _kind = head == '>' ? Kind::LargerThan : Kind::SmallerThan;

        if (auto size = parse_size_filter(std::string_view{_expression}.substr(1))) {
            _size = *size;
        }
        return;
    }

    _kind = head == '.' ? Kind::Extension : Kind::Substring;
    _needle = utils::to_lower(_expression);
}

auto Filter::matches(const FileRecord& record) const -> bool
{
    switch (_kind) {
        case Kind::Everything:
            return true;
        case Kind::LargerThan:
            return _size and record.size > *_size;
        case Kind::SmallerThan:
            return _size and record.size < *_size;
        case Kind::Extension:
            return utils::to_lower(record.name).ends_with(_needle);
        case Kind::Substring:
            return utils::to_lower(record.name).find(_needle) != std::string::npos;
    }

    return false;
}

auto Filter::apply(const std::vector<FileRecord>& records) const
  -> std::vector<FileRecord>
{
    return records |
           ranges::views::filter([this](const auto& r) { return matches(r); }) |
           ranges::to<std::vector>();
}

}  // namespace xdcc::search
