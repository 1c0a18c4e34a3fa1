/*
 * about.cpp - Print about info to the console
 * This file is part of TafKit.
 * Copyright © 2011-2025 Kirn Gill <segin2005@gmail.com>
 *
 * TafKit is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 *
 * Permission to use, copy, modify, and/or distribute this software for
 * any purpose with or without fee is hereby granted, provided that
 * the above copyright notice and this permission notice appear in all
 * copies.
 *
 * THE SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL
 * WARRANTIES WITH REGARD TO THIS SOFTWARE INCLUDING ALL IMPLIED
 * WARRANTIES OF MERCHANTABILITY AND FITNESS. IN NO EVENT SHALL THE
 * AUTHOR BE LIABLE FOR ANY SPECIAL, DIRECT, INDIRECT, OR CONSEQUENTIAL
 * DAMAGES OR ANY DAMAGES WHATSOEVER RESULTING FROM LOSS OF USE, DATA
 * OR PROFITS, WHETHER IN AN ACTION OF CONTRACT, NEGLIGENCE OR OTHER
 * TORTIOUS ACTION, ARISING OUT OF OR IN CONNECTION WITH THE USE OR
 * PERFORMANCE OF THIS SOFTWARE.
 */

#include "tafkit.h"
#include "about.h"

#include <openssl/opensslv.h>

static const char _about_message[] = "This is taftool, part of TafKit version " TAFKIT_VERSION ".\n"
            "\n"
            "Copyright © 2009-2025 Kirn Gill II <segin2005@gmail.com>\n"
            "\n"
            "TafKit is free software. You may redistribute and/or modify it under\n"
            "the terms of the ISC License <https://opensource.org/licenses/ISC>\n"
            "\n"
            "Built with libogg and " OPENSSL_VERSION_TEXT ".\n"
            "\n"
            "Written by " TAFKIT_MAINTAINER "\n";

static const char _usage_message[] =
            "Usage:\n"
            "  taftool -o OUT.taf [-n] [-t TS|-t REF.taf] [--tag KEY=VALUE ...] [--vendor S] IN.opus...\n"
            "  taftool -i FILE.taf                 show information and validate\n"
            "  taftool -c OTHER.taf [-D] FILE.taf  compare two containers (-D: page level)\n"
            "  taftool -s OUTDIR FILE.taf          verify, then split into one .opus file per track\n"
            "\n"
            "Options:\n"
            "  -t, --timestamp TS|FILE   timestamp/serial: number, 'now', or a reference .taf\n"
            "  -n, --no-header           write the page stream only, without the 4096 byte header\n"
            "      --tag KEY=VALUE       comment for the generated OpusTags (repeatable)\n"
            "      --vendor STRING       vendor for the generated OpusTags (default 'TafKit " TAFKIT_VERSION "')\n"
            "      --keep-tags           keep the first track's OpusTags, dropping comments that overflow a page\n"
            "      --hash-scope SCOPE    'bodies' (page bodies, default) or 'pages'\n"
            "      --channels N          expected channel count when validating (default 2)\n"
            "      --rate HZ             expected input sample rate when validating (default 48000)\n"
            "  -C, --config FILE         read key=value settings\n"
            "  -d, --debug CHANNELS      comma list of ogg,opus,taf,validate,compare,config,cli or all\n"
            "  -l, --logfile FILE        write debug output to FILE\n"
            "  -h, --help                this text\n"
            "  -v, --version             version and license\n"
            "\n"
            "Exit status: 0 ok, 1 usage or I/O error, 2 codec error, 3 invalid or different.\n";

void about_console()
{
    std::cout << _about_message << std::endl;
}

void usage_console()
{
    std::cout << _usage_message;
}
