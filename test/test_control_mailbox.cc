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


#include "transfer_layer/control_mailbox.h"
#include "common/mesh_defines.h"
#include <gtest/gtest.h>

namespace {

st_control_message make_message(int type, uint32_t id, std::vector<int> chunks)
{
	st_control_message message;
	message.type=type;
	message.transfer_id=id;
	message.chunks=chunks;
	return message;
}

}  // namespace

TEST(ControlMailbox, IgnoresEventsForUnopenedTransfers)
{
	cl_control_mailbox mailbox;
	EXPECT_EQ(ERROR_, mailbox.post("!b", make_message(CONTROL_OK, 7, {})));

	std::vector<int> requested;
	EXPECT_EQ(MAILBOX_EMPTY, mailbox.poll("!b", 7, &requested));
}

TEST(ControlMailbox, MergesRequestsIntoSortedSet)
{
	cl_control_mailbox mailbox;
	mailbox.open("!b", 7);
	EXPECT_EQ(SUCCESS, mailbox.post("!b", make_message(CONTROL_REQ, 7, {5, 1})));
	EXPECT_EQ(SUCCESS, mailbox.post("!b", make_message(CONTROL_REQ, 7, {1, 3})));

	std::vector<int> requested;
	ASSERT_EQ(MAILBOX_REQUESTED, mailbox.poll("!b", 7, &requested));
	EXPECT_EQ(std::vector<int>({1, 3, 5}), requested);
	EXPECT_EQ(MAILBOX_EMPTY, mailbox.poll("!b", 7, &requested));
}

TEST(ControlMailbox, CompletionTakesPriority)
{
	cl_control_mailbox mailbox;
	mailbox.open("!b", 7);
	mailbox.post("!b", make_message(CONTROL_REQ, 7, {2}));
	mailbox.post("!b", make_message(CONTROL_OK, 7, {}));

	std::vector<int> requested;
	EXPECT_EQ(MAILBOX_COMPLETED, mailbox.poll("!b", 7, &requested));
	EXPECT_EQ(MAILBOX_COMPLETED, mailbox.poll("!b", 7, &requested));
}

TEST(ControlMailbox, KeysOnNodeAndTransferId)
{
	cl_control_mailbox mailbox;
	mailbox.open("!b", 7);
	mailbox.open("!c", 7);
	EXPECT_EQ(2, mailbox.get_open_count());

	EXPECT_EQ(ERROR_, mailbox.post("!b", make_message(CONTROL_OK, 8, {})));
	EXPECT_EQ(SUCCESS, mailbox.post("!c", make_message(CONTROL_OK, 7, {})));

	std::vector<int> requested;
	EXPECT_EQ(MAILBOX_EMPTY, mailbox.poll("!b", 7, &requested));
	EXPECT_EQ(MAILBOX_COMPLETED, mailbox.poll("!c", 7, &requested));

	mailbox.close("!b", 7);
	mailbox.close("!c", 7);
	EXPECT_EQ(0, mailbox.get_open_count());
	EXPECT_EQ(ERROR_, mailbox.post("!c", make_message(CONTROL_OK, 7, {})));
}

TEST(ControlMailbox, KeepsLatestAcknowledgement)
{
	cl_control_mailbox mailbox;
	mailbox.open("!b", 7);
	mailbox.post("!b", make_message(CONTROL_ACK, 7, {0, 1}));
	mailbox.post("!b", make_message(CONTROL_ACK, 7, {0, 1, 2}));

	std::vector<int> acked;
	ASSERT_EQ(SUCCESS, mailbox.get_acked("!b", 7, &acked));
	EXPECT_EQ(std::vector<int>({0, 1, 2}), acked);
	EXPECT_EQ(ERROR_, mailbox.get_acked("!b", 9, &acked));

	std::vector<int> requested;
	EXPECT_EQ(MAILBOX_EMPTY, mailbox.poll("!b", 7, &requested));
}
