#include "reldb/common/errors.hpp"

namespace reldb {

namespace {

class ReldbErrorCategory final : public std::error_category {
public:
    const char* name() const noexcept override
    {
        return "reldb";
    }

    std::string message(int condition) const override
    {
        switch (static_cast<Errc>(condition)) {
        case Errc::Success:
            return "success";
        case Errc::Syntax:
            return "syntax error";
        case Errc::Schema:
            return "schema error";
        case Errc::Constraint:
            return "constraint violation";
        case Errc::Execution:
            return "execution error";
        case Errc::Storage:
            return "storage error";
        default:
            return "unknown reldb error";
        }
    }
};

const ReldbErrorCategory kCategory{};

}  // namespace

const std::error_category& reldb_error_category() noexcept
{
    return kCategory;
}

std::error_code make_error_code(Errc value) noexcept
{
    return {static_cast<int>(value), reldb_error_category()};
}

void throw_error(Errc code, const std::string& message)
{
    throw std::system_error(make_error_code(code), message);
}

}  // namespace reldb
