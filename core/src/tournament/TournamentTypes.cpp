#include "swissim/core/tournament/TournamentTypes.h"

#include <algorithm>
#include <sstream>

namespace swissim::core::tournament {

std::string Record::Label() const {
    std::ostringstream out;
    out << wins << '-' << losses;
    if (draws > 0) {
        out << '-' << draws;
    }
    return out.str();
}

std::vector<Competitor> MakeField(int competitor_count) {
    std::vector<Competitor> field;
    if (competitor_count <= 0) {
        return field;
    }
    field.reserve(static_cast<size_t>(competitor_count));
    for (int i = 0; i < competitor_count; ++i) {
        Competitor competitor;
        competitor.id = i;
        field.push_back(std::move(competitor));
    }
    return field;
}

const Competitor* FindCompetitor(const std::vector<Competitor>& field, int id) {
    if (id >= 0 && id < static_cast<int>(field.size()) && field[static_cast<size_t>(id)].id == id) {
        return &field[static_cast<size_t>(id)];
    }
    const auto it = std::find_if(field.begin(), field.end(), [id](const Competitor& entry) {
        return entry.id == id;
    });
    return it == field.end() ? nullptr : &*it;
}

}  // namespace swissim::core::tournament
