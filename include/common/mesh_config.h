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

#ifndef INC_MESH_CONFIG_H_
#define INC_MESH_CONFIG_H_

#include "common/mesh_defines.h"
#include <cstdint>

struct st_mesh_config
{
	int frame_size = MESH_FRAME_SIZE;
	uint32_t max_payload_size = MESH_MAX_PAYLOAD_SIZE;
	int text_mtu = MESH_TEXT_MTU;

	bool compress_payload = true;
	int compress_min_size = MESH_COMPRESS_MIN_SIZE;
	double compress_min_saving = MESH_COMPRESS_MIN_SAVING;
	int zstd_level = MESH_ZSTD_LEVEL;

	int max_retries = MESH_MAX_RETRIES;
	int retry_base_delay_ms = MESH_RETRY_BASE_DELAY_MS;

	int chunk_delay_ms = MESH_CHUNK_DELAY_MS;
	int min_chunk_delay_ms = MESH_MIN_CHUNK_DELAY_MS;
	int max_chunk_delay_ms = MESH_MAX_CHUNK_DELAY_MS;
	bool adaptive_pacing = true;
	double pacing_low_threshold = MESH_PACING_LOW_THRESHOLD;
	double pacing_high_threshold = MESH_PACING_HIGH_THRESHOLD;
	double pacing_increase = MESH_PACING_INCREASE;
	double pacing_decrease = MESH_PACING_DECREASE;

	int wait_rounds = MESH_WAIT_ROUNDS;
	int wait_round_ms = MESH_WAIT_ROUND_MS;
	int wait_poll_ms = MESH_WAIT_POLL_MS;

	int stall_check_ms = MESH_STALL_CHECK_MS;
	int stall_request_ms = MESH_STALL_REQUEST_MS;
	int transfer_timeout_ms = MESH_TRANSFER_TIMEOUT_MS;
	int chunk_overhead_ms = MESH_CHUNK_OVERHEAD_MS;
	double timeout_multiplier = MESH_TIMEOUT_MULTIPLIER;
	int timeout_cap_ms = MESH_TIMEOUT_CAP_MS;
	int completed_retention_ms = MESH_COMPLETED_RETENTION_MS;

	int ok_repeats = MESH_OK_REPEATS;
	int ok_spacing_ms = MESH_OK_SPACING_MS;
};

// Checks and normalizes a configuration. Out of range pacing values are
// clamped, structurally impossible values (frame not larger than the
// header, no retries) are rejected.
int mesh_config_validate(st_mesh_config* config);

// Minimum pacing delay with adaptation turned off.
void mesh_config_fast_mode(st_mesh_config* config);

int mesh_chunk_payload_size(const st_mesh_config& config);

// max(floor, min(total_chunks * (pacing + overhead) * multiplier, cap))
long long mesh_adaptive_timeout_ms(const st_mesh_config& config, int total_chunks);

#endif
