#include "rules/builtin.hpp"

#include <iterator>

namespace conform::rules {

auto builtin_rules() -> std::vector<Rule> {
    std::vector<Rule> all;
    for (auto group : {spacing_rules, layout_rules, naming_rules, structure_rules, idiom_rules}) {
        std::vector<Rule> rules = group();
        all.insert(all.end(), std::make_move_iterator(rules.begin()),
                   std::make_move_iterator(rules.end()));
    }
    return all;
}

} // namespace conform::rules
