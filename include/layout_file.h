// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file layout_file.h
 * @brief File helpers for the command line front end
 *
 * The layout core never touches the filesystem; these wrap reading the raw
 * input, writing the re-encoded output and naming the output file.
 */

#pragma once

#include <string>

namespace kale {

/**
 * @brief Read a whole file into a string
 *
 * @param path File to read
 * @param[out] contents File contents on success
 * @param[out] error Error message on failure
 * @return true on success
 */
bool read_layout_file(const std::string& path, std::string& contents, std::string& error);

/**
 * @brief Write a string to a file, replacing it
 *
 * @param path File to write
 * @param contents Data to write
 * @param[out] error Error message on failure
 * @return true on success
 */
bool write_layout_file(const std::string& path, const std::string& contents, std::string& error);

/**
 * @brief Derive the output path for an input file
 *
 * "board.json" -> "board<suffix>.json". A name without a ".json" extension
 * gets "<suffix>.json" appended.
 *
 * @param input_path Input file path
 * @param suffix Inserted before the extension (e.g. "_output")
 * @return Output file path
 */
std::string derive_output_path(const std::string& input_path, const std::string& suffix);

} // namespace kale
