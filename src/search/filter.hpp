#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "search/types.hpp"

namespace xdcc::search {

/**
 * @brief Result filter expression
 *
 * ">1GB" / "<500M" compare sizes, ".mkv" matches the file extension,
 * anything else is a case-insensitive name substring. An empty expression
 * matches everything, an unparsable size matches nothing.
 */
class Filter
{
 public:
    explicit Filter(std::string_view expression);

    auto matches(const FileRecord& record) const -> bool;
    auto apply(const std::vector<FileRecord>& records) const
      -> std::vector<FileRecord>;

    auto expression() const -> const std::string& { return _expression; }

 private:
    enum class Kind
    {
        Everything,
        LargerThan,
        SmallerThan,
        Extension,
        Substring,
    };

    std::string _expression;
    Kind _kind = Kind::Everything;
    std::string _needle;
    std::optional<std::int64_t> _size;
};

}  // namespace xdcc::search
