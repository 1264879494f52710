#include "qf/domains.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>

namespace qf
{
static bool is_ldh(unsigned char c)
{
    return std::isalnum(c) || c == '-';
}

bool is_valid_domain(std::string_view name)
{
    if (!name.empty() && name.back() == '.') name.remove_suffix(1);
    if (name.empty() || name.size() > 253) return false;

    std::string_view last;
    std::size_t start = 0;
    while (start <= name.size())
    {
        std::size_t dot = name.find('.', start);
        if (dot == std::string_view::npos) dot = name.size();
        std::string_view label = name.substr(start, dot - start);
        if (label.empty() || label.size() > 63) return false;
        if (label.front() == '-' || label.back() == '-') return false;
        if (!std::ranges::all_of(label, [](char c) { return is_ldh(static_cast<unsigned char>(c)); }))
            return false;
        last = label;
        start = dot + 1;
    }

    // rejects dotted IPv4 literals and other numeric-only names
    return !std::ranges::all_of(last, [](char c) { return std::isdigit(static_cast<unsigned char>(c)); });
}

const std::string &DomainPool::pick(std::mt19937 &rng) const
{
    if (names_.empty()) throw std::out_of_range("pick from empty domain pool");
    std::uniform_int_distribution<std::size_t> dist(0, names_.size() - 1);
    return names_[dist(rng)];
}

static std::string_view trim(std::string_view s)
{
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

DomainPool load_domains(const std::string &path)
{
    std::ifstream in(path);
    if (!in) throw std::runtime_error("cannot open domain file: " + path);

    std::vector<std::string> names;
    std::string line;
    while (std::getline(in, line))
    {
        std::string_view s = trim(line);
        if (s.empty()) continue;
        if (!is_valid_domain(s)) continue;
        names.emplace_back(s);
    }
    if (in.bad()) throw std::runtime_error("error reading domain file: " + path);
    return DomainPool(std::move(names));
}
} // namespace qf
