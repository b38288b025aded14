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

#include "transfer_layer/adaptive_pacer.h"
#include <cstdio>
#include <cmath>

cl_adaptive_pacer::cl_adaptive_pacer(const st_mesh_config& config)
{
	min_delay_ms=config.min_chunk_delay_ms;
	max_delay_ms=config.max_chunk_delay_ms;
	delay_ms=config.chunk_delay_ms;
	if(delay_ms < min_delay_ms) delay_ms=min_delay_ms;
	if(delay_ms > max_delay_ms) delay_ms=max_delay_ms;
	low_threshold=config.pacing_low_threshold;
	high_threshold=config.pacing_high_threshold;
	increase=config.pacing_increase;
	decrease=config.pacing_decrease;
	enabled=config.adaptive_pacing;
	successes=0;
	failures=0;
}

cl_adaptive_pacer::~cl_adaptive_pacer()
{
}

void cl_adaptive_pacer::record_success()
{
	successes++;
}

void cl_adaptive_pacer::record_failure()
{
	failures++;
}

double cl_adaptive_pacer::get_success_rate() const
{
	int attempts=successes + failures;
	if(attempts == 0)
		return 1.0;
	return (double)successes / (double)attempts;
}

int cl_adaptive_pacer::update()
{
	if(!enabled)
		return get_delay_ms();

	double rate=get_success_rate();
	double old_delay=delay_ms;
	if(rate < low_threshold)
	{
		delay_ms=delay_ms * increase;
		if(delay_ms > max_delay_ms)
			delay_ms=max_delay_ms;
	}
	else if(rate >= high_threshold && delay_ms > min_delay_ms)
	{
		delay_ms=delay_ms * decrease;
		if(delay_ms < min_delay_ms)
			delay_ms=min_delay_ms;
	}

	if(g_verbose && fabs(delay_ms - old_delay) > 10.0)
	{
		printf("[PACING] Delay %.0f ms -> %.0f ms (success rate %.1f%%)\n", old_delay, delay_ms, rate * 100.0);
		fflush(stdout);
	}
	return get_delay_ms();
}

int cl_adaptive_pacer::get_delay_ms() const
{
	return (int)(delay_ms + 0.5);
}
