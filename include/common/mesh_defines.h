/*
 * Mercury Mesh: reliable payload transfer over packet radio mesh networks.
 * Copyright (C) 2022-2024 Fadi Jerji
 * Author: Fadi Jerji
 * Email: fadi.jerji@  <gmail.com, caisresearch.com, ieee.org>
 * ORCID: 0000-0002-2076-5831
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as
 * published by the Free Software Foundation, version 3 of the
 * License.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 *
 */

#ifndef INC_MESH_DEFINES_H_
#define INC_MESH_DEFINES_H_

#define SUCCESS 1
#define ERROR_ -1

#define YES 1
#define NO 0

// Wire format
#define MESH_HEADER_SIZE            15
#define MESH_FRAME_SIZE             200      // transport MTU for one application datagram
#define MESH_MAX_CHUNKS             255
#define MESH_MAX_PAYLOAD_SIZE       10000000 // 10 MB sanity bound
#define MESH_TEXT_MTU               200      // longest control text sent in one message

// Compression
#define MESH_COMPRESS_MIN_SIZE      500      // payloads at or below this are sent raw
#define MESH_COMPRESS_MIN_SAVING    0.05     // adopt only if more than 5% smaller
#define MESH_ZSTD_LEVEL             19

// Sender timing (ms)
#define MESH_RETRY_BASE_DELAY_MS    3000
#define MESH_MAX_RETRIES            3
#define MESH_MAX_RETRIES_LIMIT      16       // backoff doubles per attempt, keep the shift bounded
#define MESH_CHUNK_DELAY_MS         4000
#define MESH_MIN_CHUNK_DELAY_MS     1000
#define MESH_MAX_CHUNK_DELAY_MS     10000
#define MESH_WAIT_ROUNDS            10
#define MESH_WAIT_ROUND_MS          15000
#define MESH_WAIT_POLL_MS           50

// Adaptive pacing
#define MESH_PACING_LOW_THRESHOLD   0.90
#define MESH_PACING_HIGH_THRESHOLD  0.98
#define MESH_PACING_INCREASE        1.2
#define MESH_PACING_DECREASE        0.95

// Receiver timing (ms)
#define MESH_STALL_CHECK_MS         15000
#define MESH_STALL_REQUEST_MS       20000
#define MESH_TRANSFER_TIMEOUT_MS    60000    // adaptive expiry floor
#define MESH_CHUNK_OVERHEAD_MS      2000
#define MESH_TIMEOUT_MULTIPLIER     1.5
#define MESH_TIMEOUT_CAP_MS         300000
#define MESH_COMPLETED_RETENTION_MS 300000
#define MESH_OK_REPEATS             3
#define MESH_OK_SPACING_MS          500

extern bool g_verbose;
extern bool g_debug;

#endif
