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

#ifndef INC_TIMER_H_
#define INC_TIMER_H_

class cl_timer
{
private:
	long long start_time;
	long long accumulated;
	int counting;

public:
	cl_timer();
	~cl_timer();

	void start();
	void stop();
	void reset();
	int is_counting() const { return counting; }
	long long get_elapsed_time_ms();
};

#endif
