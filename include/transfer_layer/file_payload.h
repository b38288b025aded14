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

#ifndef INC_FILE_PAYLOAD_H_
#define INC_FILE_PAYLOAD_H_

#include "transfer_layer/transport.h"
#include <string>

class cl_file_payload_source : public cl_payload_source
{
public:
	explicit cl_file_payload_source(const std::string& _path) : path(_path) {}

	int read_payload(std::vector<uint8_t>* payload);

private:
	std::string path;
};

// Writes each completed payload to <directory>/<prefix>_<sender>_<transfer_id>.bin
class cl_file_payload_sink : public cl_payload_sink
{
public:
	cl_file_payload_sink(const std::string& _directory, const std::string& _prefix) : directory(_directory), prefix(_prefix) {}

	int on_payload(const std::string& sender, uint32_t transfer_id, const std::vector<uint8_t>& payload);

	std::string make_path(const std::string& sender, uint32_t transfer_id) const;

private:
	std::string directory;
	std::string prefix;
};

#endif
