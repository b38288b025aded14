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

#include "common/mesh_config.h"
#include <cstdio>

bool g_verbose = false;
bool g_debug = false;

int mesh_config_validate(st_mesh_config* config)
{
	if(config == NULL)
		return ERROR_;

	if(config->frame_size <= MESH_HEADER_SIZE)
	{
		printf("[CONFIG] frame_size %d must exceed the %d byte header\n", config->frame_size, MESH_HEADER_SIZE);
		fflush(stdout);
		return ERROR_;
	}
	if(config->max_retries < 1)
	{
		printf("[CONFIG] max_retries must be at least 1 (got %d)\n", config->max_retries);
		fflush(stdout);
		return ERROR_;
	}
	if(config->max_retries > MESH_MAX_RETRIES_LIMIT)
	{
		printf("[CONFIG] max_retries %d above limit, using %d\n", config->max_retries, MESH_MAX_RETRIES_LIMIT);
		config->max_retries = MESH_MAX_RETRIES_LIMIT;
	}
	if(config->retry_base_delay_ms < 0)
		config->retry_base_delay_ms = 0;
	if(config->max_payload_size == 0 || config->max_payload_size > MESH_MAX_PAYLOAD_SIZE)
		config->max_payload_size = MESH_MAX_PAYLOAD_SIZE;

	if(config->min_chunk_delay_ms < 0)
		config->min_chunk_delay_ms = 0;
	if(config->max_chunk_delay_ms < config->min_chunk_delay_ms)
		config->max_chunk_delay_ms = config->min_chunk_delay_ms;
	if(config->chunk_delay_ms < config->min_chunk_delay_ms)
	{
		printf("[CONFIG] chunk delay %d ms below minimum, using %d ms\n", config->chunk_delay_ms, config->min_chunk_delay_ms);
		config->chunk_delay_ms = config->min_chunk_delay_ms;
	}
	else if(config->chunk_delay_ms > config->max_chunk_delay_ms)
	{
		printf("[CONFIG] chunk delay %d ms above maximum, using %d ms\n", config->chunk_delay_ms, config->max_chunk_delay_ms);
		config->chunk_delay_ms = config->max_chunk_delay_ms;
	}

	if(config->pacing_high_threshold < config->pacing_low_threshold)
		config->pacing_high_threshold = config->pacing_low_threshold;
	if(config->pacing_increase < 1.0)
		config->pacing_increase = 1.0;
	if(config->pacing_decrease > 1.0 || config->pacing_decrease <= 0.0)
		config->pacing_decrease = 1.0;

	if(config->text_mtu < 32)
		config->text_mtu = 32;
	if(config->wait_rounds < 0)
		config->wait_rounds = 0;
	if(config->wait_poll_ms < 1)
		config->wait_poll_ms = 1;
	if(config->stall_check_ms < 1)
		config->stall_check_ms = 1;
	if(config->ok_repeats < 1)
		config->ok_repeats = 1;
	if(config->timeout_cap_ms < config->transfer_timeout_ms)
		config->timeout_cap_ms = config->transfer_timeout_ms;

	fflush(stdout);
	return SUCCESS;
}

void mesh_config_fast_mode(st_mesh_config* config)
{
	config->chunk_delay_ms = config->min_chunk_delay_ms;
	config->adaptive_pacing = false;
	printf("[CONFIG] Fast mode: chunk_delay=%d ms, adaptive=off\n", config->chunk_delay_ms);
	fflush(stdout);
}

int mesh_chunk_payload_size(const st_mesh_config& config)
{
	return config.frame_size - MESH_HEADER_SIZE;
}

long long mesh_adaptive_timeout_ms(const st_mesh_config& config, int total_chunks)
{
	double expected = (double)total_chunks * (double)(config.chunk_delay_ms + config.chunk_overhead_ms);
	double scaled = expected * config.timeout_multiplier;
	if(scaled > (double)config.timeout_cap_ms)
		scaled = (double)config.timeout_cap_ms;
	long long timeout = (long long)scaled;
	if(timeout < config.transfer_timeout_ms)
		timeout = config.transfer_timeout_ms;
	return timeout;
}
