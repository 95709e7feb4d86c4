// SPDX-License-Identifier: Apache-2.0
// input.hpp - Abstract per-frame input contract consumed by the simulation, plus an in-memory keyboard state
#pragma once

#include <initializer_list>
#include <string>
#include <string_view>
#include <unordered_set>

namespace serpent::input {

// Canonical lower-case key names used by the simulation.
namespace key {
inline constexpr std::string_view up = "w";
inline constexpr std::string_view down = "s";
inline constexpr std::string_view left = "a";
inline constexpr std::string_view right = "d";
inline constexpr std::string_view arrow_up = "arrowup";
inline constexpr std::string_view arrow_down = "arrowdown";
inline constexpr std::string_view arrow_left = "arrowleft";
inline constexpr std::string_view arrow_right = "arrowright";
inline constexpr std::string_view fire = "space";
inline constexpr std::string_view dash = "shift";
inline constexpr std::string_view burst = "e";
inline constexpr std::string_view mine = "q";
inline constexpr std::string_view pause = "p";
} // namespace key

class InputSource
{
public:
    virtual ~InputSource() = default;
    // True while any of the listed keys is held.
    virtual bool is_down(std::initializer_list<std::string_view> keys) const = 0;
    // True at most once per physical press; the press is forgotten at end_frame().
    virtual bool consume(std::string_view key) = 0;
    virtual void end_frame() = 0;
};

// Maps device key names onto the canonical set (" " and "spacebar" become "space", case folded).
std::string canonical_key(std::string_view raw);

// Event-fed keyboard state. Device glue calls press()/release(); the simulation reads it through InputSource.
class KeyboardState : public InputSource
{
public:
    void press(std::string_view raw);
    void release(std::string_view raw);
    void release_all();

    bool is_down(std::initializer_list<std::string_view> keys) const override;
    bool consume(std::string_view key) override;
    void end_frame() override;

private:
    std::unordered_set<std::string> m_held;
    std::unordered_set<std::string> m_just_pressed;
};

} // namespace serpent::input
