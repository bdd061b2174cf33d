#pragma once

#include "result.hpp"
#include "types.hpp"
#include "object.hpp"
#include "error_buffer.hpp"
#include "task.hpp"
#include "loop.hpp"
#include "listener.hpp"
#include "event.hpp"
#include "property.hpp"
#include "observable.hpp"
#include "manifest.hpp"
#include "dispatcher.hpp"
#include "completion_tracker.hpp"
#include "global.hpp"
#include "manifest_tree.hpp"
#include "schema.hpp"
#include "version.hpp"
