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

#ifndef INC_ADAPTIVE_PACER_H_
#define INC_ADAPTIVE_PACER_H_

#include "common/mesh_config.h"

// Inter-chunk delay driven by the running success ratio of send attempts.
// Below the low threshold the delay grows, at or above the high threshold
// it shrinks, always within [min_chunk_delay_ms, max_chunk_delay_ms].
class cl_adaptive_pacer
{
public:
	explicit cl_adaptive_pacer(const st_mesh_config& config);
	~cl_adaptive_pacer();

	void record_success();
	void record_failure();

	// Applies one adjustment step and returns the new delay in ms.
	int update();

	int get_delay_ms() const;
	double get_success_rate() const;
	int get_successes() const { return successes; }
	int get_failures() const { return failures; }

private:
	double delay_ms;
	double min_delay_ms;
	double max_delay_ms;
	double low_threshold;
	double high_threshold;
	double increase;
	double decrease;
	bool enabled;
	int successes;
	int failures;
};

#endif
