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
#include "common/mesh_defines.h"
#include <cstdio>

namespace {

bool starts_with(const std::string& text, const char* prefix)
{
	return text.compare(0, std::char_traits<char>::length(prefix), prefix) == 0;
}

int hex_value(char c)
{
	if(c >= '0' && c <= '9') return c - '0';
	if(c >= 'a' && c <= 'f') return c - 'a' + 10;
	if(c >= 'A' && c <= 'F') return c - 'A' + 10;
	return -1;
}

bool parse_transfer_id(const std::string& field, uint32_t* id)
{
	if(field.empty() || field.size() > 8)
		return false;
	uint32_t value=0;
	for(size_t i=0;i<field.size();i++)
	{
		int v=hex_value(field[i]);
		if(v < 0)
			return false;
		value=(value << 4) | (uint32_t)v;
	}
	*id=value;
	return true;
}

bool parse_chunk_list(const std::string& field, std::vector<int>* chunks)
{
	size_t pos=0;
	while(pos <= field.size())
	{
		size_t comma=field.find(',', pos);
		if(comma == std::string::npos)
			comma=field.size();
		std::string item=field.substr(pos, comma - pos);
		pos=comma + 1;

		if(item.empty())
			continue;
		if(item.size() > 3)
			return false;
		int value=0;
		for(size_t i=0;i<item.size();i++)
		{
			if(item[i] < '0' || item[i] > '9')
				return false;
			value=value * 10 + (item[i] - '0');
		}
		// chunk indices are bounded by the u8 total_chunks field
		if(value >= MESH_MAX_CHUNKS)
			return false;
		chunks->push_back(value);
	}
	return true;
}

std::string format_id(uint32_t transfer_id)
{
	char buf[9];
	snprintf(buf, sizeof(buf), "%08x", transfer_id);
	return std::string(buf);
}

}  // namespace

int control_parse(const std::string& text, st_control_message* message)
{
	int type;
	size_t prefix_len;
	if(starts_with(text, "ACK:"))
	{
		type=CONTROL_ACK;
		prefix_len=4;
	}
	else if(starts_with(text, "REQ:"))
	{
		type=CONTROL_REQ;
		prefix_len=4;
	}
	else if(starts_with(text, "OK:"))
	{
		type=CONTROL_OK;
		prefix_len=3;
	}
	else
	{
		return CONTROL_NOT_PROTOCOL;
	}

	st_control_message parsed;
	parsed.type=type;
	std::string rest=text.substr(prefix_len);

	if(type == CONTROL_OK)
	{
		if(!parse_transfer_id(rest, &parsed.transfer_id))
			return CONTROL_MALFORMED;
	}
	else
	{
		size_t colon=rest.find(':');
		if(colon == std::string::npos)
			return CONTROL_MALFORMED;
		if(!parse_transfer_id(rest.substr(0, colon), &parsed.transfer_id))
			return CONTROL_MALFORMED;
		if(!parse_chunk_list(rest.substr(colon + 1), &parsed.chunks))
			return CONTROL_MALFORMED;
	}

	*message=parsed;
	return CONTROL_PARSED;
}

std::string control_format(const st_control_message& message)
{
	if(message.type == CONTROL_OK)
		return control_format_ok(message.transfer_id);

	std::string text=(message.type == CONTROL_ACK) ? "ACK:" : "REQ:";
	text+=format_id(message.transfer_id);
	text+=':';
	for(size_t i=0;i<message.chunks.size();i++)
	{
		if(i > 0)
			text+=',';
		text+=std::to_string(message.chunks[i]);
	}
	return text;
}

std::string control_format_ok(uint32_t transfer_id)
{
	return "OK:" + format_id(transfer_id);
}

std::vector<std::string> control_format_req(uint32_t transfer_id, const std::vector<int>& chunks, size_t text_mtu)
{
	std::vector<std::string> messages;
	std::string prefix="REQ:" + format_id(transfer_id) + ":";
	std::string current=prefix;

	for(size_t i=0;i<chunks.size();i++)
	{
		std::string item=std::to_string(chunks[i]);
		bool first=(current.size() == prefix.size());
		size_t needed=current.size() + item.size() + (first ? 0 : 1);
		if(!first && needed > text_mtu)
		{
			messages.push_back(current);
			current=prefix;
			first=true;
		}
		if(!first)
			current+=',';
		current+=item;
	}
	if(current.size() > prefix.size() || messages.empty())
		messages.push_back(current);
	return messages;
}

const char* control_type_string(int type)
{
	switch(type)
	{
	case CONTROL_ACK:
		return "ACK";
	case CONTROL_REQ:
		return "REQ";
	case CONTROL_OK:
		return "OK";
	default:
		return "?";
	}
}

std::string chunk_list_preview(const std::vector<int>& chunks, size_t max_shown)
{
	std::string out="[";
	for(size_t i=0;i<chunks.size() && i<max_shown;i++)
	{
		if(i > 0)
			out+=", ";
		out+=std::to_string(chunks[i]);
	}
	out+="]";
	if(chunks.size() > max_shown)
		out+="...";
	return out;
}
