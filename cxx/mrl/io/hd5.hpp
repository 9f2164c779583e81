#pragma once

#include "file.hpp"
#include "reader.hpp"
#include "writer.hpp"
