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

#include "transfer_layer/file_payload.h"
#include "common/mesh_defines.h"
#include <cstdio>
#include <fstream>
#include <iterator>

int cl_file_payload_source::read_payload(std::vector<uint8_t>* payload)
{
	std::ifstream file(path.c_str(), std::ios::in | std::ios::binary);
	if(!file.is_open())
	{
		printf("[FILE] Cannot open %s\n", path.c_str());
		fflush(stdout);
		return ERROR_;
	}

	payload->assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
	if(file.bad())
	{
		printf("[FILE] Read error on %s\n", path.c_str());
		fflush(stdout);
		payload->clear();
		return ERROR_;
	}
	if(payload->size() > MESH_MAX_PAYLOAD_SIZE)
	{
		printf("[FILE] %s is %zu bytes, above the %d byte limit\n", path.c_str(), payload->size(), MESH_MAX_PAYLOAD_SIZE);
		fflush(stdout);
		payload->clear();
		return ERROR_;
	}
	return SUCCESS;
}

std::string cl_file_payload_sink::make_path(const std::string& sender, uint32_t transfer_id) const
{
	// Node ids such as "!a1b2c3d4" are kept, path separators are not.
	std::string safe_sender;
	for(size_t i=0;i<sender.size();i++)
	{
		char c=sender[i];
		if(c == '/' || c == '\\' || c == ':')
			safe_sender+='_';
		else
			safe_sender+=c;
	}

	char id[9];
	snprintf(id, sizeof(id), "%08x", transfer_id);

	std::string path=directory;
	if(!path.empty() && path[path.size() - 1] != '/')
		path+='/';
	return path + prefix + "_" + safe_sender + "_" + id + ".bin";
}

int cl_file_payload_sink::on_payload(const std::string& sender, uint32_t transfer_id, const std::vector<uint8_t>& payload)
{
	std::string path=make_path(sender, transfer_id);
	std::ofstream file(path.c_str(), std::ios::out | std::ios::binary | std::ios::trunc);
	if(!file.is_open())
	{
		printf("[FILE] Cannot create %s\n", path.c_str());
		fflush(stdout);
		return ERROR_;
	}
	file.write((const char*)payload.data(), (std::streamsize)payload.size());
	file.close();
	if(file.fail())
	{
		printf("[FILE] Write error on %s\n", path.c_str());
		fflush(stdout);
		return ERROR_;
	}
	printf("[FILE] Saved %zu bytes to %s\n", payload.size(), path.c_str());
	fflush(stdout);
	return SUCCESS;
}
