#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace scaletuner {

struct Note {
    int index = 0;
    std::string name;
    double cents = 0.0;   // above the scale's tonic, in [0, 1200)
};

// Raw description of a tuning system.
struct ScaleDefinition {
    std::string name;
    std::map<int, double> cents;             // degree -> cents above the tonic
    std::map<int, std::string> note_names;   // optional; chromatic names when empty
};

// C, C#/Db, ..., B
std::map<int, std::string> default_note_names();

// Immutable tuning system. Degree 0 sits at 0 cents and the remaining degrees
// increase strictly below 1200 cents. Names like "C#/Db" are also reachable by
// each of their "/"-separated aliases.
class Scale {
public:
    // Throws ConfigError when the definition is malformed.
    static Scale from_definition(const ScaleDefinition& def);
    // `divisions` equal steps per octave; 12 gives chromatic note names.
    static Scale equal_temperament(int divisions = 12);

    const std::string& name() const { return name_; }
    std::size_t size() const { return notes_.size(); }
    const std::vector<Note>& notes() const { return notes_; }
    const std::vector<double>& cents() const { return cents_; }
    const std::vector<std::string>& names() const { return names_; }

    // Throw LookupError for unknown degrees or names.
    const Note& note(int degree) const;
    const Note& note(const std::string& name) const;
    int index_of(const std::string& name) const;
    bool contains(const std::string& name) const;

    const Note& operator[](int degree) const { return note(degree); }
    const Note& operator[](const std::string& name) const { return note(name); }

private:
    Scale() = default;

    std::string name_;
    std::vector<double> cents_;
    std::vector<std::string> names_;
    std::vector<Note> notes_;
    std::unordered_map<std::string, int> name_to_index_;
};

} // namespace scaletuner
