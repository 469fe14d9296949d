/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "dcb/dcb_errors.h"
#include "dcb_parser.h"
#include "utils/fs_utils.h"
#include "utils/log.h"
