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

#ifndef INC_SIMULATED_LINK_H_
#define INC_SIMULATED_LINK_H_

#include "transfer_layer/mesh_endpoint.h"
#include "transfer_layer/transport.h"
#include <pthread.h>
#include <map>
#include <random>
#include <string>

// In-process mesh: every node gets a cl_transport whose packets are handed
// synchronously to the destination endpoint, after a seeded loss draw.
// A lost packet still counts as accepted by the sender's radio.
class cl_simulated_link
{
public:
	explicit cl_simulated_link(unsigned int seed);
	~cl_simulated_link();

	cl_transport* add_node(const std::string& node_id);
	int attach(const std::string& node_id, cl_mesh_endpoint* endpoint);

	void set_data_loss(double probability);
	void set_text_loss(double probability);

	int get_data_delivered();
	int get_data_dropped();
	int get_text_delivered();
	int get_text_dropped();

private:
	class cl_link_port : public cl_transport
	{
	public:
		cl_link_port(cl_simulated_link* _link, const std::string& _node_id) : link(_link), node_id(_node_id) {}

		int send_text(const std::string& text, const std::string& destination);
		int send_data(const uint8_t* data, size_t len, const std::string& destination, bool want_ack);

	private:
		cl_simulated_link* link;
		std::string node_id;
	};

	cl_mesh_endpoint* route(const std::string& destination, double loss, bool* dropped, int* delivered_counter, int* dropped_counter);
	int deliver_text(const std::string& from, const std::string& text, const std::string& destination);
	int deliver_data(const std::string& from, const uint8_t* data, size_t len, const std::string& destination);

	std::map<std::string, cl_link_port*> ports;
	std::map<std::string, cl_mesh_endpoint*> endpoints;
	std::mt19937 rng;
	double data_loss;
	double text_loss;
	int data_delivered;
	int data_dropped;
	int text_delivered;
	int text_dropped;
	pthread_mutex_t mutex;
};

#endif
