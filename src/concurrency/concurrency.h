#pragma once

#include "globals.h"
#include "channel.hpp"
#include "safelatch.h"
#include "threadpool.hpp"
