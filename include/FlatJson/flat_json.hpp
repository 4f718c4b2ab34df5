#pragma once

#include "annotated.hpp"
#include "options.hpp"
#include "flat_path.hpp"
#include "parser.hpp"
#include "serializer.hpp"
#include "generic_transformers.hpp"
