#include "logfetch/selector.hpp"

#include "util/logger.hpp"
#include "util/string_utils.hpp"

#include <charconv>
#include <istream>
#include <ostream>

namespace logfetch {

ComponentMenu::ComponentMenu(std::vector<MenuEntry> entries) : entries_(std::move(entries)) {}

MenuState ComponentMenu::Submit(std::string_view input) {
    if (state_ != MenuState::AwaitingChoice) return state_;

    const std::string_view choice = Trim(input);

    size_t number = 0;
    const auto [ptr, ec] = std::from_chars(choice.data(), choice.data() + choice.size(), number);
    if (ec == std::errc() && ptr == choice.data() + choice.size() && !choice.empty()) {
        if (number >= 1 && number <= entries_.size()) {
            chosen_ = number - 1;
            state_ = MenuState::Resolved;
            return state_;
        }
        state_ = MenuState::Invalid;
        return state_;
    }

    for (size_t i = 0; i < entries_.size(); ++i) {
        if (EqualsIgnoreCase(choice, entries_[i].label)) {
            chosen_ = i;
            state_ = MenuState::Resolved;
            return state_;
        }
    }

    state_ = MenuState::Invalid;
    return state_;
}

void ComponentMenu::Reprompt() {
    if (state_ == MenuState::Invalid) state_ = MenuState::AwaitingChoice;
}

void ComponentMenu::Render(std::ostream& os) const {
    os << "Available components:\n";
    for (size_t i = 0; i < entries_.size(); ++i) {
        os << "  " << (i + 1) << ") " << entries_[i].label << "\n";
    }
    os << "Select component [1-" << entries_.size() << "]: " << std::flush;
}

std::vector<MenuEntry> Selector::BuildMenu(const Environment& env) {
    std::vector<MenuEntry> entries;
    for (ComponentKind k : env.AvailableKinds()) {
        entries.push_back(MenuEntry{ComponentName(k), ComponentRequest::Of(k)});
    }
    if (!entries.empty()) {
        entries.push_back(MenuEntry{"all", ComponentRequest::All()});
    }
    return entries;
}

Result Selector::Resolve(const ComponentRequest& request, const Environment& env, Selection& out) {
    out = Selection{};
    if (!request.all) {
        if (!env.Has(request.kind)) {
            return Result::Fail(kCapabilityMismatch,
                                std::string(ComponentName(request.kind)) + " requires " +
                                    RequiredRole(request.kind));
        }
        out.kinds.push_back(request.kind);
        return Result::Ok();
    }

    out.all = true;
    out.kinds = env.AvailableKinds();
    if (out.kinds.empty()) {
        return Result::Fail(kNoComponents, "no components available");
    }
    return Result::Ok();
}

Result Selector::RunMenu(const Environment& env, std::istream& in, std::ostream& os, Selection& out) {
    out = Selection{};
    auto entries = BuildMenu(env);
    if (entries.empty()) {
        return Result::Fail(kNoComponents, "no components available");
    }

    ComponentMenu menu(std::move(entries));
    std::string line;
    while (menu.State() != MenuState::Resolved) {
        menu.Render(os);
        if (!std::getline(in, line)) {
            os << "\n";
            return Result::Fail(kNoSelection, "no selection made");
        }
        if (menu.Submit(line) == MenuState::Invalid) {
            LogWarn("invalid choice '%s'", std::string(Trim(line)).c_str());
            menu.Reprompt();
        }
    }

    return Resolve(menu.Choice(), env, out);
}

Result Selector::CheckCoverage(const std::vector<ComponentHomes>& catalog) {
    size_t total = 0;
    for (const auto& entry : catalog) {
        if (entry.homes.empty()) {
            LogWarn("no %s homes found", ComponentName(entry.kind));
        }
        total += entry.homes.size();
    }
    if (total == 0) {
        return Result::Fail(kNoHomesFound, "no homes found, check environment");
    }
    return Result::Ok();
}

} // namespace logfetch
