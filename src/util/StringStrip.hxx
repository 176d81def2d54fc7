// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

/**
 * Skips whitespace at the beginning of the string.
 */
[[gnu::pure]] [[gnu::returns_nonnull]] [[gnu::nonnull]]
char *
StripLeft(char *p) noexcept;

/**
 * Null-terminates the string after the last non-whitespace
 * character.
 */
[[gnu::nonnull]]
void
StripRight(char *p) noexcept;
