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

#ifndef INC_CONTROL_MAILBOX_H_
#define INC_CONTROL_MAILBOX_H_

#include "transfer_layer/control_channel.h"
#include "transfer_layer/transfer_key.h"
#include <pthread.h>
#include <map>
#include <set>
#include <string>
#include <vector>

#define MAILBOX_EMPTY      0
#define MAILBOX_REQUESTED  1
#define MAILBOX_COMPLETED  2

// Hands control events arriving on the delivery context to the sender
// thread that owns the matching transfer. Only transfers opened by a
// sender are tracked, events for anything else are dropped.
class cl_control_mailbox
{
public:
	cl_control_mailbox();
	~cl_control_mailbox();

	void open(const std::string& node, uint32_t transfer_id);
	void close(const std::string& node, uint32_t transfer_id);

	// Returns SUCCESS if the event matched an open transfer, ERROR_ otherwise.
	int post(const std::string& from, const st_control_message& message);

	// Completion takes priority over pending requests. On MAILBOX_REQUESTED
	// the merged, sorted request set is moved into *requested.
	int poll(const std::string& node, uint32_t transfer_id, std::vector<int>* requested);

	int get_acked(const std::string& node, uint32_t transfer_id, std::vector<int>* chunks);
	int get_open_count();

private:
	struct st_mailbox_entry
	{
		bool completed;
		std::set<int> requested;
		std::vector<int> acked;

		st_mailbox_entry() : completed(false) {}
	};

	std::map<st_transfer_key, st_mailbox_entry> entries;
	pthread_mutex_t mutex;
};

#endif
