#pragma once

#include "node.h"
#include "expressions.h"
#include "view.h"
#include "statements.h"
#include "definitions.h"
