#pragma once

#include <cstddef>
#include <random>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace qf
{
// Hostname syntax check: labels of [A-Za-z0-9-] (1..63 bytes, no leading or
// trailing hyphen), total length <= 253, final label not all digits.
// A single trailing dot is accepted.
bool is_valid_domain(std::string_view name);

// Immutable, ordered set of candidate query names.
class DomainPool
{
public:
    DomainPool() = default;
    explicit DomainPool(std::vector<std::string> names) : names_(std::move(names)) {}

    bool empty() const { return names_.empty(); }
    std::size_t size() const { return names_.size(); }
    const std::string &at(std::size_t i) const { return names_.at(i); }

    // Uniform random pick; the pool must not be empty.
    const std::string &pick(std::mt19937 &rng) const;

private:
    std::vector<std::string> names_;
};

// Reads a newline-delimited domain list. Blank lines are skipped and lines
// failing is_valid_domain are dropped. Throws std::runtime_error when the
// file cannot be opened or read.
DomainPool load_domains(const std::string &path);
} // namespace qf
