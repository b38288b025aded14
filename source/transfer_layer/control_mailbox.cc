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
#include "common/os_interop.h"
#include <cstdio>

cl_control_mailbox::cl_control_mailbox()
{
	MUTEX_INIT(&mutex);
}

cl_control_mailbox::~cl_control_mailbox()
{
	MUTEX_DESTROY(&mutex);
}

void cl_control_mailbox::open(const std::string& node, uint32_t transfer_id)
{
	MUTEX_LOCK(&mutex);
	entries[st_transfer_key(node, transfer_id)]=st_mailbox_entry();
	MUTEX_UNLOCK(&mutex);
}

void cl_control_mailbox::close(const std::string& node, uint32_t transfer_id)
{
	MUTEX_LOCK(&mutex);
	entries.erase(st_transfer_key(node, transfer_id));
	MUTEX_UNLOCK(&mutex);
}

int cl_control_mailbox::post(const std::string& from, const st_control_message& message)
{
	int success=ERROR_;
	MUTEX_LOCK(&mutex);
	std::map<st_transfer_key, st_mailbox_entry>::iterator it=entries.find(st_transfer_key(from, message.transfer_id));
	if(it != entries.end())
	{
		st_mailbox_entry& entry=it->second;
		if(message.type == CONTROL_OK)
		{
			entry.completed=true;
		}
		else if(message.type == CONTROL_REQ)
		{
			entry.requested.insert(message.chunks.begin(), message.chunks.end());
		}
		else if(message.type == CONTROL_ACK)
		{
			entry.acked=message.chunks;
		}
		success=SUCCESS;
	}
	MUTEX_UNLOCK(&mutex);

	if(success == ERROR_ && g_debug)
	{
		printf("[CTRL] %s:%08x from %s matches no open transfer, ignored\n",
			control_type_string(message.type), message.transfer_id, from.c_str());
		fflush(stdout);
	}
	return success;
}

int cl_control_mailbox::poll(const std::string& node, uint32_t transfer_id, std::vector<int>* requested)
{
	int status=MAILBOX_EMPTY;
	MUTEX_LOCK(&mutex);
	std::map<st_transfer_key, st_mailbox_entry>::iterator it=entries.find(st_transfer_key(node, transfer_id));
	if(it != entries.end())
	{
		if(it->second.completed)
		{
			status=MAILBOX_COMPLETED;
		}
		else if(!it->second.requested.empty())
		{
			requested->assign(it->second.requested.begin(), it->second.requested.end());
			it->second.requested.clear();
			status=MAILBOX_REQUESTED;
		}
	}
	MUTEX_UNLOCK(&mutex);
	return status;
}

int cl_control_mailbox::get_acked(const std::string& node, uint32_t transfer_id, std::vector<int>* chunks)
{
	int success=ERROR_;
	MUTEX_LOCK(&mutex);
	std::map<st_transfer_key, st_mailbox_entry>::iterator it=entries.find(st_transfer_key(node, transfer_id));
	if(it != entries.end())
	{
		*chunks=it->second.acked;
		success=SUCCESS;
	}
	MUTEX_UNLOCK(&mutex);
	return success;
}

int cl_control_mailbox::get_open_count()
{
	MUTEX_LOCK(&mutex);
	int count=(int)entries.size();
	MUTEX_UNLOCK(&mutex);
	return count;
}
