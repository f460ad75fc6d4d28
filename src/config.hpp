/************************************************
 PNG Stash: implemented in C
 See LICENSE

 Configuration file handling.
 ************************************************/
#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <stdlib.h>
#include "stash.hpp"

stashfield *	ReadCfg	(stashfield *Args);

#endif
