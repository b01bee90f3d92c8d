/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __QLINK_RANDOM_HPP_INCLUDED__
#define __QLINK_RANDOM_HPP_INCLUDED__

#include <stdint.h>
#include <stddef.h>

namespace qlink
{
//  Seeds the random number generator.
void seed_random ();

//  Generates random value.
uint32_t generate_random ();

//  Fills size_ bytes at buf_ with random data. Used for message ids.
void generate_random_bytes (unsigned char *buf_, size_t size_);
}

#endif
