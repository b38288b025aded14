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
#include "test_helpers.h"
#include <gtest/gtest.h>
#include <functional>

namespace {

bool wait_until(const std::function<bool()>& condition, long timeout_ms)
{
	long long deadline=get_time_ms() + timeout_ms;
	while(get_time_ms() < deadline)
	{
		if(condition())
			return true;
		msleep(2);
	}
	return condition();
}

}  // namespace

TEST(StallMonitor, SweepsPeriodicallyUntilStopped)
{
	cl_recording_transport transport;
	cl_recording_sink sink;
	cl_receiver receiver(&transport, &sink, fast_test_config());
	cl_stall_monitor monitor(&receiver, 5);

	EXPECT_FALSE(monitor.is_running());
	ASSERT_EQ(SUCCESS, monitor.start());
	EXPECT_TRUE(monitor.is_running());
	EXPECT_EQ(ERROR_, monitor.start());

	EXPECT_TRUE(wait_until([&] { return monitor.get_sweep_count() >= 3; }, 2000));

	monitor.stop();
	EXPECT_FALSE(monitor.is_running());
	int sweeps=monitor.get_sweep_count();
	msleep(30);
	EXPECT_EQ(sweeps, monitor.get_sweep_count());

	monitor.stop();
}

TEST(StallMonitor, StopReturnsWithoutWaitingForPeriod)
{
	cl_recording_transport transport;
	cl_recording_sink sink;
	cl_receiver receiver(&transport, &sink, fast_test_config());
	cl_stall_monitor monitor(&receiver, 60000);

	ASSERT_EQ(SUCCESS, monitor.start());
	long long before=get_time_ms();
	monitor.stop();
	EXPECT_LT(get_time_ms() - before, 5000);
	EXPECT_EQ(0, monitor.get_sweep_count());
}

TEST(StallMonitor, RequestsMissingChunksOfIdleTransfer)
{
	st_mesh_config config=fast_test_config();
	config.stall_request_ms=20;
	cl_recording_transport transport;
	cl_recording_sink sink;
	cl_receiver receiver(&transport, &sink, config);

	std::vector<std::vector<uint8_t> > frames=build_frames(pattern_payload(500), 0x3c, false, config.frame_size);
	ASSERT_EQ(CHUNK_STORED, receiver.on_chunk("!a", frames[0].data(), frames[0].size()));

	cl_stall_monitor monitor(&receiver, 5);
	ASSERT_EQ(SUCCESS, monitor.start());
	EXPECT_TRUE(wait_until([&] { return transport.count_texts_with_prefix("REQ:0000003c:1,2") > 0; }, 2000));
	monitor.stop();
}

TEST(StallMonitor, CanRestartAfterStop)
{
	cl_recording_transport transport;
	cl_recording_sink sink;
	cl_receiver receiver(&transport, &sink, fast_test_config());
	cl_stall_monitor monitor(&receiver, 5);

	ASSERT_EQ(SUCCESS, monitor.start());
	monitor.stop();
	ASSERT_EQ(SUCCESS, monitor.start());
	EXPECT_TRUE(wait_until([&] { return monitor.get_sweep_count() >= 1; }, 2000));
	monitor.stop();
}
