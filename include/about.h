/*
 * about.h - Console about and usage text
 * This file is part of TafKit.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TafKit is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef TAFKIT_ABOUT_H
#define TAFKIT_ABOUT_H

void about_console();
void usage_console();

#endif // TAFKIT_ABOUT_H
