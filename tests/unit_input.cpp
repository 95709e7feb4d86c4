// SPDX-License-Identifier: Apache-2.0
// unit_input.cpp
// Key name folding and held / one-shot semantics of the keyboard state.
#include "game/input.hpp"

#include <cassert>
#include <iostream>

using namespace serpent::input;

int main()
{
    assert(canonical_key(" ") == "space");
    assert(canonical_key("Spacebar") == "space");
    assert(canonical_key("ArrowUp") == "arrowup");
    assert(canonical_key("Shift") == "shift");
    assert(canonical_key("Q") == "q");

    KeyboardState kb;
    assert(!kb.is_down({key::up, key::arrow_up}));
    kb.press("W");
    assert(kb.is_down({key::up}));
    assert(kb.is_down({key::arrow_up, key::up}));
    assert(!kb.is_down({key::down}));

    // One-shot: consumed once per press.
    assert(kb.consume(key::up));
    assert(!kb.consume(key::up));

    // Auto-repeat of a held key does not re-arm.
    kb.press("w");
    assert(!kb.consume(key::up));

    // end_frame forgets unconsumed presses but keeps held keys.
    kb.press(" ");
    kb.end_frame();
    assert(!kb.consume(key::fire));
    assert(kb.is_down({key::fire}));

    // Release + press re-arms.
    kb.release("space");
    assert(!kb.is_down({key::fire}));
    kb.press("Spacebar");
    assert(kb.consume(key::fire));

    kb.release_all();
    assert(!kb.is_down({key::up, key::fire}));

    // Works through the abstract contract.
    InputSource &src = kb;
    kb.press("e");
    assert(src.consume(key::burst));
    src.end_frame();

    std::cout << "unit_input OK" << std::endl;
    return 0;
}
