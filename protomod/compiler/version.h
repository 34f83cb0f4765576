// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#pragma once

#define PROTOMOD_VERSION "0.1.0"
