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


#include "transfer_layer/control_channel.h"
#include <gtest/gtest.h>
#include <set>

TEST(ControlChannel, ParsesAck)
{
	st_control_message message;
	ASSERT_EQ(CONTROL_PARSED, control_parse("ACK:0000abcd:0,1,2", &message));
	EXPECT_EQ(CONTROL_ACK, message.type);
	EXPECT_EQ(0xabcdu, message.transfer_id);
	EXPECT_EQ(std::vector<int>({0, 1, 2}), message.chunks);
}

TEST(ControlChannel, ParsesRequestWithUppercaseId)
{
	st_control_message message;
	ASSERT_EQ(CONTROL_PARSED, control_parse("REQ:DEADBEEF:5,17,254", &message));
	EXPECT_EQ(CONTROL_REQ, message.type);
	EXPECT_EQ(0xDEADBEEFu, message.transfer_id);
	EXPECT_EQ(std::vector<int>({5, 17, 254}), message.chunks);
}

TEST(ControlChannel, ParsesOk)
{
	st_control_message message;
	ASSERT_EQ(CONTROL_PARSED, control_parse("OK:12345678", &message));
	EXPECT_EQ(CONTROL_OK, message.type);
	EXPECT_EQ(0x12345678u, message.transfer_id);
	EXPECT_TRUE(message.chunks.empty());
}

TEST(ControlChannel, OtherTextIsNotProtocol)
{
	st_control_message message;
	EXPECT_EQ(CONTROL_NOT_PROTOCOL, control_parse("hello there", &message));
	EXPECT_EQ(CONTROL_NOT_PROTOCOL, control_parse("", &message));
	EXPECT_EQ(CONTROL_NOT_PROTOCOL, control_parse("ok:12345678", &message));
	EXPECT_EQ(CONTROL_NOT_PROTOCOL, control_parse("ACK", &message));
	EXPECT_EQ(CONTROL_NOT_PROTOCOL, control_parse("/status", &message));
}

TEST(ControlChannel, RejectsMalformedControlText)
{
	st_control_message message;
	EXPECT_EQ(CONTROL_MALFORMED, control_parse("REQ:0000abcd", &message));
	EXPECT_EQ(CONTROL_MALFORMED, control_parse("REQ:xyz:1", &message));
	EXPECT_EQ(CONTROL_MALFORMED, control_parse("REQ::1", &message));
	EXPECT_EQ(CONTROL_MALFORMED, control_parse("REQ:123456789:1", &message));
	EXPECT_EQ(CONTROL_MALFORMED, control_parse("REQ:0000abcd:1,a", &message));
	EXPECT_EQ(CONTROL_MALFORMED, control_parse("REQ:0000abcd:-1", &message));
	EXPECT_EQ(CONTROL_MALFORMED, control_parse("ACK:0000abcd:255", &message));
	EXPECT_EQ(CONTROL_MALFORMED, control_parse("ACK:0000abcd:1000", &message));
	EXPECT_EQ(CONTROL_MALFORMED, control_parse("OK:", &message));
	EXPECT_EQ(CONTROL_MALFORMED, control_parse("OK:0000abcd:1", &message));
}

TEST(ControlChannel, SkipsEmptyListItems)
{
	st_control_message message;
	ASSERT_EQ(CONTROL_PARSED, control_parse("REQ:0000abcd:1,,2,", &message));
	EXPECT_EQ(std::vector<int>({1, 2}), message.chunks);

	ASSERT_EQ(CONTROL_PARSED, control_parse("REQ:0000abcd:", &message));
	EXPECT_TRUE(message.chunks.empty());
}

TEST(ControlChannel, FormatsEightDigitLowercaseIds)
{
	EXPECT_EQ("OK:000000ab", control_format_ok(0xAB));

	st_control_message message;
	message.type=CONTROL_ACK;
	message.transfer_id=0x00C0FFEE;
	message.chunks={0, 3, 10};
	EXPECT_EQ("ACK:00c0ffee:0,3,10", control_format(message));

	message.type=CONTROL_REQ;
	message.chunks={5};
	EXPECT_EQ("REQ:00c0ffee:5", control_format(message));
}

TEST(ControlChannel, FormattedMessagesParseBack)
{
	st_control_message message;
	message.type=CONTROL_REQ;
	message.transfer_id=0x9abcdef0;
	message.chunks={0, 99, 254};

	st_control_message parsed;
	ASSERT_EQ(CONTROL_PARSED, control_parse(control_format(message), &parsed));
	EXPECT_EQ(message.type, parsed.type);
	EXPECT_EQ(message.transfer_id, parsed.transfer_id);
	EXPECT_EQ(message.chunks, parsed.chunks);
}

TEST(ControlChannel, SplitsLongRequestsAtTextLimit)
{
	std::vector<int> chunks;
	for(int i=0;i<255;i++)
		chunks.push_back(i);

	const size_t mtu=40;
	std::vector<std::string> messages=control_format_req(0x11223344, chunks, mtu);
	ASSERT_GT(messages.size(), 1u);

	std::set<int> seen;
	for(size_t i=0;i<messages.size();i++)
	{
		EXPECT_LE(messages[i].size(), mtu) << messages[i];
		st_control_message parsed;
		ASSERT_EQ(CONTROL_PARSED, control_parse(messages[i], &parsed)) << messages[i];
		EXPECT_EQ(CONTROL_REQ, parsed.type);
		EXPECT_EQ(0x11223344u, parsed.transfer_id);
		EXPECT_FALSE(parsed.chunks.empty());
		seen.insert(parsed.chunks.begin(), parsed.chunks.end());
	}
	EXPECT_EQ(chunks.size(), seen.size());
}

TEST(ControlChannel, ShortRequestStaysInOneMessage)
{
	std::vector<std::string> messages=control_format_req(0x1, {4, 7}, 200);
	ASSERT_EQ(1u, messages.size());
	EXPECT_EQ("REQ:00000001:4,7", messages[0]);
}

TEST(ControlChannel, PreviewTruncatesLongLists)
{
	EXPECT_EQ("[0, 1, 2]", chunk_list_preview({0, 1, 2}, 5));
	EXPECT_EQ("[0, 1]...", chunk_list_preview({0, 1, 2, 3}, 2));
	EXPECT_EQ("[]", chunk_list_preview({}, 3));
}

TEST(ControlChannel, TypeNames)
{
	EXPECT_STREQ("ACK", control_type_string(CONTROL_ACK));
	EXPECT_STREQ("REQ", control_type_string(CONTROL_REQ));
	EXPECT_STREQ("OK", control_type_string(CONTROL_OK));
}
