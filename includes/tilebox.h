#ifndef TILEBOX_H
#define TILEBOX_H
#pragma once

#include "tilebox/blob.h"
#include "tilebox/containers.h"
#include "tilebox/converter.h"
#include "tilebox/coord.h"
#include "tilebox/data_reader.h"
#include "tilebox/error.h"
#include "tilebox/format.h"
#include "tilebox/logging.h"
#include "tilebox/lru_cache.h"
#include "tilebox/metadata.h"
#include "tilebox/reader.h"
#include "tilebox/server.h"
#include "tilebox/versatiles.h"
#include "tilebox/writer.h"

#endif // TILEBOX_H
