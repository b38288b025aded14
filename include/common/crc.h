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

#ifndef INC_CRC_H_
#define INC_CRC_H_

#include <cstddef>
#include <cstdint>

// CRC-32 (IEEE 802.3, reflected polynomial 0xEDB88320), same values as zlib's crc32().
uint32_t CRC32_calc(const uint8_t* data, size_t length);

// Continue a running CRC over another block, starting from crc=0.
uint32_t CRC32_update(uint32_t crc, const uint8_t* data, size_t length);

#endif
