#pragma once

// Aggregator header for commonly-used core types.
#include "helpdesk_core/types/chunk.hpp"
#include "helpdesk_core/types/document.hpp"
#include "helpdesk_core/types/progress.hpp"
#include "helpdesk_core/types/retrieval_result.hpp"
#include "helpdesk_core/types/store_record.hpp"
