#include "mcpserve/tools/toolset.hpp"

#include <cctype>

namespace mcpserve::tools
{

std::string to_snake_case(const std::string& name)
{
    std::string out;
    out.reserve(name.size() + 4);
    for (std::size_t i = 0; i < name.size(); ++i)
    {
        unsigned char c = static_cast<unsigned char>(name[i]);
        if (std::isupper(c))
        {
            bool prev_lower = i > 0 && (std::islower(static_cast<unsigned char>(name[i - 1])) ||
                                        std::isdigit(static_cast<unsigned char>(name[i - 1])));
            bool next_lower =
                i + 1 < name.size() && std::islower(static_cast<unsigned char>(name[i + 1]));
            bool prev_upper = i > 0 && std::isupper(static_cast<unsigned char>(name[i - 1]));
            if (!out.empty() && out.back() != '_' && (prev_lower || (prev_upper && next_lower)))
                out.push_back('_');
            out.push_back(static_cast<char>(std::tolower(c)));
        }
        else if (c == '-' || c == ' ')
        {
            if (!out.empty() && out.back() != '_')
                out.push_back('_');
        }
        else
        {
            out.push_back(static_cast<char>(c));
        }
    }
    return out;
}

std::string exposed_name(const std::string& name_space, const std::string& operation)
{
    if (name_space.empty())
        return operation;
    return name_space + NAMESPACE_SEPARATOR + operation;
}

Toolset::Toolset(std::string name_space) : name_space_(std::move(name_space)) {}

Toolset& Toolset::add(const Tool& tool)
{
    tools_.push_back(tool.renamed(exposed_name(name_space_, tool.name())));
    return *this;
}

} // namespace mcpserve::tools
