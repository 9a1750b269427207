// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <sys/types.h>

class UniqueFileDescriptor;

/**
 * Throws on error.
 */
UniqueFileDescriptor
OpenReadOnly(const char *path, int flags=0);

/**
 * Open (and create if necessary) a file for appending.
 *
 * Throws on error.
 */
UniqueFileDescriptor
OpenAppend(const char *path, mode_t mode=0640);
