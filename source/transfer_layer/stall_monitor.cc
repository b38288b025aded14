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

#include "transfer_layer/stall_monitor.h"
#include "common/os_interop.h"
#include <chrono>
#include <cstdio>

cl_stall_monitor::cl_stall_monitor(cl_receiver* _receiver, int _period_ms)
	: receiver(_receiver), period_ms(_period_ms), stop_requested(false), running(false), sweeps(0)
{
	if(period_ms < 1)
		period_ms=1;
}

cl_stall_monitor::~cl_stall_monitor()
{
	stop();
}

int cl_stall_monitor::start()
{
	if(running.load())
		return ERROR_;

	{
		std::lock_guard<std::mutex> lock(wake_mutex);
		stop_requested=false;
	}
	running.store(true);
	worker=std::thread(&cl_stall_monitor::run, this);
	if(g_verbose)
	{
		printf("[STALL] Monitor started, period %d ms\n", period_ms);
		fflush(stdout);
	}
	return SUCCESS;
}

void cl_stall_monitor::stop()
{
	{
		std::lock_guard<std::mutex> lock(wake_mutex);
		stop_requested=true;
	}
	wake.notify_all();
	if(worker.joinable())
		worker.join();
	running.store(false);
}

void cl_stall_monitor::run()
{
	std::unique_lock<std::mutex> lock(wake_mutex);
	while(!stop_requested)
	{
		if(wake.wait_for(lock, std::chrono::milliseconds(period_ms), [this] { return stop_requested; }))
			break;

		lock.unlock();
		st_sweep_result result;
		receiver->check_stalled(get_time_ms(), &result);
		sweeps++;
		if(g_debug)
		{
			printf("[STALL] Sweep %d: %d requests, %d stalled, %d expired, %d purged\n",
				sweeps.load(), result.requests_sent, result.timed_out, result.expired, result.purged);
			fflush(stdout);
		}
		lock.lock();
	}
}
