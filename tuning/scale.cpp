#include "scaletuner/scale.hpp"
#include "scaletuner/errors.hpp"

#include <sstream>

namespace scaletuner {

std::map<int, std::string> default_note_names() {
    return {
        {0, "C"}, {1, "C#/Db"}, {2, "D"}, {3, "D#/Eb"}, {4, "E"}, {5, "F"},
        {6, "F#/Gb"}, {7, "G"}, {8, "G#/Ab"}, {9, "A"}, {10, "A#/Bb"}, {11, "B"},
    };
}

static std::string scale_error(const std::string& scale_name, const std::string& what) {
    return "scale '" + scale_name + "': " + what;
}

Scale Scale::from_definition(const ScaleDefinition& def) {
    if (def.cents.empty()) {
        throw ConfigError(scale_error(def.name, "no notes defined"));
    }
    const std::map<int, std::string> names = def.note_names.empty() ? default_note_names() : def.note_names;
    if (names.size() != def.cents.size()) {
        std::ostringstream msg;
        msg << def.cents.size() << " cent values but " << names.size() << " note names";
        throw ConfigError(scale_error(def.name, msg.str()));
    }

    Scale out;
    out.name_ = def.name;

    // std::map iterates keys in order, so contiguous degrees must equal their position.
    int expected = 0;
    for (const auto& [degree, cents] : def.cents) {
        if (degree != expected) {
            throw ConfigError(scale_error(def.name, "scale degrees must run 0..N-1 without gaps"));
        }
        out.cents_.push_back(cents);
        ++expected;
    }
    expected = 0;
    for (const auto& [degree, name] : names) {
        if (degree != expected) {
            throw ConfigError(scale_error(def.name, "note name degrees must run 0..N-1 without gaps"));
        }
        out.names_.push_back(name);
        ++expected;
    }

    if (out.cents_[0] != 0.0) {
        throw ConfigError(scale_error(def.name, "degree 0 must be 0 cents"));
    }
    for (std::size_t i = 0; i < out.cents_.size(); ++i) {
        if (!(out.cents_[i] >= 0.0 && out.cents_[i] < 1200.0)) {
            throw ConfigError(scale_error(def.name, "cent values must lie in [0, 1200)"));
        }
        if (i > 0 && !(out.cents_[i] > out.cents_[i - 1])) {
            throw ConfigError(scale_error(def.name, "cent values must be strictly increasing"));
        }
    }

    for (std::size_t i = 0; i < out.names_.size(); ++i) {
        const int index = static_cast<int>(i);
        const std::string& name = out.names_[i];
        out.name_to_index_[name] = index;
        if (name.find('/') != std::string::npos) {
            std::istringstream parts(name);
            std::string alias;
            while (std::getline(parts, alias, '/')) {
                if (!alias.empty()) out.name_to_index_[alias] = index;
            }
        }
        out.notes_.push_back(Note{index, name, out.cents_[i]});
    }
    return out;
}

Scale Scale::equal_temperament(int divisions) {
    if (divisions < 1) {
        throw ConfigError("equal temperament needs at least one division");
    }
    ScaleDefinition def;
    def.name = std::to_string(divisions) + "-EDO";
    const double step = 1200.0 / divisions;
    for (int i = 0; i < divisions; ++i) {
        def.cents[i] = step * i;
        if (divisions != 12) def.note_names[i] = std::to_string(i);
    }
    return from_definition(def);
}

const Note& Scale::note(int degree) const {
    if (degree < 0 || degree >= static_cast<int>(notes_.size())) {
        throw LookupError(scale_error(name_, "no degree " + std::to_string(degree)));
    }
    return notes_[static_cast<std::size_t>(degree)];
}

const Note& Scale::note(const std::string& name) const {
    return notes_[static_cast<std::size_t>(index_of(name))];
}

int Scale::index_of(const std::string& name) const {
    auto it = name_to_index_.find(name);
    if (it == name_to_index_.end()) {
        throw LookupError(scale_error(name_, "no note named '" + name + "'"));
    }
    return it->second;
}

bool Scale::contains(const std::string& name) const {
    return name_to_index_.count(name) > 0;
}

} // namespace scaletuner
