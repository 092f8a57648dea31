#pragma once

#include <set>
#include <string>

namespace lexigraph {

/**
 * @brief Source of truth for term existence
 *
 * Terms are owned by another subsystem; the relation core only asks whether
 * an id exists before accepting an asserted edge.
 */
class TermDirectory {
public:
    virtual ~TermDirectory() = default;
    virtual bool term_exists(const std::string& term_id) const = 0;
};

// Trusts every id
class AnyTermDirectory : public TermDirectory {
public:
    bool term_exists(const std::string&) const override { return true; }
};

// Fixed set of known ids
class StaticTermDirectory : public TermDirectory {
public:
    StaticTermDirectory() = default;
    explicit StaticTermDirectory(std::set<std::string> terms) : terms_(std::move(terms)) {}

    /**
     * @brief Load a JSON array of term ids
     * @throws std::runtime_error if the file cannot be read or is not an array
     */
    static StaticTermDirectory from_json_file(const std::string& path);

    void add(const std::string& term_id) { terms_.insert(term_id); }

    bool term_exists(const std::string& term_id) const override {
        return terms_.count(term_id) > 0;
    }

    size_t size() const { return terms_.size(); }

private:
    std::set<std::string> terms_;
};

} // namespace lexigraph
