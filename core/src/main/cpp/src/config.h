/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Lucenia project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

#pragma once

namespace cval {
#ifndef CVAL_SENSITIVE_MARK
#define CVAL_SENSITIVE_MARK "sensitive"
#endif

#ifndef CVAL_GOSTRING_MAX_DEPTH
#define CVAL_GOSTRING_MAX_DEPTH 32
#endif

#ifndef CVAL_LOG_FILE_NAME
#define CVAL_LOG_FILE_NAME "cval.log"
#endif

#ifndef CVAL_LOG_MAX_FILE_SIZE
#define CVAL_LOG_MAX_FILE_SIZE (64 * 1024 * 1024)   // rotate at 64MB
#endif

#ifndef CVAL_LOG_MAX_FILES
#define CVAL_LOG_MAX_FILES 5    // rotated files kept beside the live log
#endif

}
