// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "layout_error.h"
#include "layout_types.h"

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace kale {

/**
 * @brief Stateful walker turning row entries into placed keys
 *
 * Carries the running column offset, row counter and property accumulator
 * across row items. Each instance handles one layout; create a new one
 * (or call reset()) per parse.
 *
 * Usage:
 * @code
 * LayoutInterpreter interpreter;
 * DecodeError err = interpreter.run(rows);
 * if (err.success()) {
 *     keyboard.keys = interpreter.take_keys();
 * }
 * @endcode
 */
class LayoutInterpreter {
  public:
    LayoutInterpreter();

    /** @brief Clear all state and placed keys */
    void reset();

    /**
     * @brief Interpret every row of a decoded layout
     *
     * Stops at the first failure. Keys placed before the failure stay
     * in the interpreter but callers must not use them.
     *
     * @param rows JSON array of rows
     * @return DecodeError with ROW_SHAPE or PROPERTY_SCHEMA on failure
     */
    DecodeError run(const nlohmann::json& rows);

    /** @brief Start a new row: column offset back to 0 */
    void begin_row();

    /** @brief Finish the current row: row counter advances by exactly 1 */
    void end_row();

    /**
     * @brief Process one row item
     *
     * Objects are property patches, strings are legends, anything else is
     * ignored.
     */
    DecodeError feed(const nlohmann::json& item);

    /** @brief Merge a decoded patch into the accumulator */
    void apply_patch(const KeyProperties& patch);

    /**
     * @brief Place a key for a legend string at the current position
     * @return The key just appended
     */
    const Key& place_legend(const std::string& legend);

    double current_x() const {
        return current_x_;
    }
    double current_y() const {
        return current_y_;
    }
    int rows_completed() const {
        return row_;
    }
    const KeyProperties& properties() const {
        return properties_;
    }
    const std::vector<Key>& keys() const {
        return keys_;
    }

    /** @brief Move placed keys out of the interpreter */
    std::vector<Key> take_keys();

  private:
    double current_x_;
    double current_y_;
    int row_;
    KeyProperties properties_;
    std::vector<Key> keys_;
};

} // namespace kale
