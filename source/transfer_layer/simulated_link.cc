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

#include "transfer_layer/simulated_link.h"
#include "common/os_interop.h"
#include <cstdio>

int cl_simulated_link::cl_link_port::send_text(const std::string& text, const std::string& destination)
{
	return link->deliver_text(node_id, text, destination);
}

int cl_simulated_link::cl_link_port::send_data(const uint8_t* data, size_t len, const std::string& destination, bool want_ack)
{
	(void)want_ack;
	return link->deliver_data(node_id, data, len, destination);
}

cl_simulated_link::cl_simulated_link(unsigned int seed) : rng(seed)
{
	data_loss=0.0;
	text_loss=0.0;
	data_delivered=0;
	data_dropped=0;
	text_delivered=0;
	text_dropped=0;
	MUTEX_INIT(&mutex);
}

cl_simulated_link::~cl_simulated_link()
{
	for(std::map<std::string, cl_link_port*>::iterator it=ports.begin();it!=ports.end();++it)
	{
		delete it->second;
	}
	ports.clear();
	MUTEX_DESTROY(&mutex);
}

cl_transport* cl_simulated_link::add_node(const std::string& node_id)
{
	MUTEX_LOCK(&mutex);
	cl_link_port* port=NULL;
	std::map<std::string, cl_link_port*>::iterator it=ports.find(node_id);
	if(it != ports.end())
	{
		port=it->second;
	}
	else
	{
		port=new cl_link_port(this, node_id);
		ports[node_id]=port;
	}
	MUTEX_UNLOCK(&mutex);
	return port;
}

int cl_simulated_link::attach(const std::string& node_id, cl_mesh_endpoint* endpoint)
{
	int success=ERROR_;
	MUTEX_LOCK(&mutex);
	if(ports.find(node_id) != ports.end())
	{
		endpoints[node_id]=endpoint;
		success=SUCCESS;
	}
	MUTEX_UNLOCK(&mutex);
	return success;
}

void cl_simulated_link::set_data_loss(double probability)
{
	MUTEX_LOCK(&mutex);
	data_loss=probability;
	MUTEX_UNLOCK(&mutex);
}

void cl_simulated_link::set_text_loss(double probability)
{
	MUTEX_LOCK(&mutex);
	text_loss=probability;
	MUTEX_UNLOCK(&mutex);
}

cl_mesh_endpoint* cl_simulated_link::route(const std::string& destination, double loss, bool* dropped, int* delivered_counter, int* dropped_counter)
{
	cl_mesh_endpoint* endpoint=NULL;
	*dropped=false;
	std::map<std::string, cl_mesh_endpoint*>::iterator it=endpoints.find(destination);
	if(it == endpoints.end())
		return NULL;
	endpoint=it->second;

	std::uniform_real_distribution<double> draw(0.0, 1.0);
	if(loss > 0.0 && draw(rng) < loss)
	{
		*dropped=true;
		(*dropped_counter)++;
	}
	else
	{
		(*delivered_counter)++;
	}
	return endpoint;
}

int cl_simulated_link::deliver_text(const std::string& from, const std::string& text, const std::string& destination)
{
	bool dropped;
	MUTEX_LOCK(&mutex);
	cl_mesh_endpoint* endpoint=route(destination, text_loss, &dropped, &text_delivered, &text_dropped);
	MUTEX_UNLOCK(&mutex);

	if(endpoint == NULL)
	{
		printf("[SIM] No route to %s for text from %s\n", destination.c_str(), from.c_str());
		fflush(stdout);
		return ERROR_;
	}
	if(dropped)
	{
		if(g_verbose)
		{
			printf("[SIM] Lost text %s -> %s: %s\n", from.c_str(), destination.c_str(), text.c_str());
			fflush(stdout);
		}
		return SUCCESS;
	}
	endpoint->on_text_message(from, text);
	return SUCCESS;
}

int cl_simulated_link::deliver_data(const std::string& from, const uint8_t* data, size_t len, const std::string& destination)
{
	bool dropped;
	MUTEX_LOCK(&mutex);
	cl_mesh_endpoint* endpoint=route(destination, data_loss, &dropped, &data_delivered, &data_dropped);
	MUTEX_UNLOCK(&mutex);

	if(endpoint == NULL)
	{
		printf("[SIM] No route to %s for data from %s\n", destination.c_str(), from.c_str());
		fflush(stdout);
		return ERROR_;
	}
	if(dropped)
	{
		if(g_verbose)
		{
			printf("[SIM] Lost %zu byte packet %s -> %s\n", len, from.c_str(), destination.c_str());
			fflush(stdout);
		}
		return SUCCESS;
	}
	endpoint->on_data_packet(from, data, len);
	return SUCCESS;
}

int cl_simulated_link::get_data_delivered()
{
	MUTEX_LOCK(&mutex);
	int n=data_delivered;
	MUTEX_UNLOCK(&mutex);
	return n;
}

int cl_simulated_link::get_data_dropped()
{
	MUTEX_LOCK(&mutex);
	int n=data_dropped;
	MUTEX_UNLOCK(&mutex);
	return n;
}

int cl_simulated_link::get_text_delivered()
{
	MUTEX_LOCK(&mutex);
	int n=text_delivered;
	MUTEX_UNLOCK(&mutex);
	return n;
}

int cl_simulated_link::get_text_dropped()
{
	MUTEX_LOCK(&mutex);
	int n=text_dropped;
	MUTEX_UNLOCK(&mutex);
	return n;
}
