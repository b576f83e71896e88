/* SPDX-License-Identifier: GPL-2.0-or-later */
/*
 * Copyright (C) 2019, Google Inc.
 * Copyright (C) 2025, Arducam
 *
 * arducli application
 */

#pragma once

enum {
	OptBus = 'b',
	OptDevice = 'd',
	OptHelp = 'h',
	OptTable = 't',
	OptVerbose = 'v',
	OptListFormats = 256,
	OptListFormatsExt = 257,
};
