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

#ifndef INC_MESH_ENDPOINT_H_
#define INC_MESH_ENDPOINT_H_

#include "common/mesh_config.h"
#include "transfer_layer/control_mailbox.h"
#include "transfer_layer/receiver.h"
#include "transfer_layer/sender.h"
#include "transfer_layer/stall_monitor.h"
#include "transfer_layer/transport.h"
#include <string>
#include <vector>

// One node's view of the protocol: inbound packets from the transport go
// in through on_text_message()/on_data_packet(), outbound payloads through
// send_payload(). The transport and sink must outlive the endpoint.
class cl_mesh_endpoint
{
public:
	cl_mesh_endpoint(const std::string& node_id, cl_transport* transport, cl_payload_sink* sink, const st_mesh_config& config);
	~cl_mesh_endpoint();

	void set_command_handler(cl_command_handler* handler) { command_handler=handler; }

	// Transport delivery context.
	void on_text_message(const std::string& from, const std::string& text);
	void on_data_packet(const std::string& from, const uint8_t* data, size_t len);

	int send_payload(const std::string& destination, const std::vector<uint8_t>& payload, st_send_stats* stats);
	int send_from_source(const std::string& destination, cl_payload_source* source, st_send_stats* stats);

	int start();
	void stop();

	const std::string& get_node_id() const { return node_id; }
	cl_receiver* get_receiver() { return &receiver; }
	cl_control_mailbox* get_mailbox() { return &mailbox; }

private:
	std::string node_id;
	st_mesh_config config;
	cl_control_mailbox mailbox;
	cl_sender sender;
	cl_receiver receiver;
	cl_stall_monitor monitor;
	cl_command_handler* command_handler;
};

#endif
