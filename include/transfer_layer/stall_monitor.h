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

#ifndef INC_STALL_MONITOR_H_
#define INC_STALL_MONITOR_H_

#include "transfer_layer/receiver.h"
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>

// Background sweep over the receiver's in-flight transfers, once per
// period. stop() wakes the worker immediately and joins it.
class cl_stall_monitor
{
public:
	cl_stall_monitor(cl_receiver* receiver, int period_ms);
	~cl_stall_monitor();

	int start();
	void stop();
	bool is_running() const { return running.load(); }
	int get_sweep_count() const { return sweeps.load(); }

private:
	void run();

	cl_receiver* receiver;
	int period_ms;

	std::thread worker;
	std::mutex wake_mutex;
	std::condition_variable wake;
	bool stop_requested;
	std::atomic<bool> running;
	std::atomic<int> sweeps;
};

#endif
