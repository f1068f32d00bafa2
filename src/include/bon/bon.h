// Public header for the bon library
#pragma once

#include <bon/error.h>
#include <bon/lexer.h>
#include <bon/number.h>
#include <bon/parser.h>
#include <bon/serializer.h>
#include <bon/value.h>
