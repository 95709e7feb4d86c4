// SPDX-License-Identifier: Apache-2.0
#include "game/input.hpp"

#include <cctype>

namespace serpent::input {

std::string canonical_key(std::string_view raw)
{
    if (raw == " ")
        return std::string(key::fire);
    std::string k;
    k.reserve(raw.size());
    for (char c : raw)
        k.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (k == "spacebar")
        return std::string(key::fire);
    return k;
}

void KeyboardState::press(std::string_view raw)
{
    auto k = canonical_key(raw);
    // Auto-repeat while held must not re-arm the one-shot edge.
    if (m_held.find(k) == m_held.end())
        m_just_pressed.insert(k);
    m_held.insert(std::move(k));
}

void KeyboardState::release(std::string_view raw)
{
    m_held.erase(canonical_key(raw));
}

void KeyboardState::release_all()
{
    m_held.clear();
}

bool KeyboardState::is_down(std::initializer_list<std::string_view> keys) const
{
    for (auto k : keys) {
        if (m_held.find(std::string(k)) != m_held.end())
            return true;
    }
    return false;
}

bool KeyboardState::consume(std::string_view key)
{
    return m_just_pressed.erase(canonical_key(key)) > 0;
}

void KeyboardState::end_frame()
{
    m_just_pressed.clear();
}

} // namespace serpent::input
