#pragma once

#include "logfetch/component_kind.hpp"
#include "logfetch/environment.hpp"
#include "logfetch/home_catalog.hpp"
#include "util/result.hpp"

#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace logfetch {

// Concrete kinds to process, in menu order.
struct Selection {
    bool all = false;
    std::vector<ComponentKind> kinds;
};

struct MenuEntry {
    std::string label;
    ComponentRequest request;
};

enum class MenuState {
    AwaitingChoice,
    Invalid,
    Resolved,
};

// One interactive choice. Submit() moves AwaitingChoice to Resolved or
// Invalid; Reprompt() moves Invalid back to AwaitingChoice.
class ComponentMenu {
  public:
    explicit ComponentMenu(std::vector<MenuEntry> entries);

    MenuState State() const { return state_; }
    const std::vector<MenuEntry>& Entries() const { return entries_; }

    // Accepts the 1-based entry number or the entry label, case-insensitive.
    MenuState Submit(std::string_view input);
    void Reprompt();

    // Valid only in Resolved.
    const ComponentRequest& Choice() const { return entries_[chosen_].request; }

    void Render(std::ostream& os) const;

  private:
    std::vector<MenuEntry> entries_;
    MenuState state_ = MenuState::AwaitingChoice;
    size_t chosen_ = 0;
};

class Selector {
  public:
    // Concrete kinds the environment has, plus "all" when there is any.
    static std::vector<MenuEntry> BuildMenu(const Environment& env);

    // kCapabilityMismatch for a concrete kind the environment lacks,
    // kNoComponents for "all" with nothing available.
    static Result Resolve(const ComponentRequest& request, const Environment& env, Selection& out);

    // Blocks on `in` until a valid choice or end of input (kNoSelection).
    // kNoComponents, before printing anything, if the menu would be empty.
    static Result RunMenu(const Environment& env, std::istream& in, std::ostream& os, Selection& out);

    // Warns per kind without homes; kNoHomesFound when none has any.
    static Result CheckCoverage(const std::vector<ComponentHomes>& catalog);
};

} // namespace logfetch
