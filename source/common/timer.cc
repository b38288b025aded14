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

#include "common/timer.h"
#include "common/os_interop.h"

cl_timer::cl_timer()
{
	start_time=0;
	accumulated=0;
	counting=0;
}

cl_timer::~cl_timer()
{
}

void cl_timer::start()
{
	if(counting)
		return;
	start_time=get_time_ms();
	counting=1;
}

void cl_timer::stop()
{
	if(!counting)
		return;
	accumulated+=get_time_ms()-start_time;
	counting=0;
}

void cl_timer::reset()
{
	accumulated=0;
	if(counting)
		start_time=get_time_ms();
}

long long cl_timer::get_elapsed_time_ms()
{
	if(counting)
		return accumulated+(get_time_ms()-start_time);
	return accumulated;
}
