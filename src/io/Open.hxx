// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

class UniqueFileDescriptor;

/**
 * Open an existing file for reading.
 *
 * Throws std::system_error on error.
 */
UniqueFileDescriptor
OpenReadOnly(const char *path);

/**
 * Create a new file for writing; an existing file is truncated.
 *
 * Throws std::system_error on error.
 */
UniqueFileDescriptor
CreateTruncate(const char *path);
