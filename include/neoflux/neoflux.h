#pragma once

#include <neoflux/batch.h>
#include <neoflux/computation.h>
#include <neoflux/computed.h>
#include <neoflux/config.h>
#include <neoflux/context.h>
#include <neoflux/dependency_graph.h>
#include <neoflux/effect.h>
#include <neoflux/errors.h>
#include <neoflux/log.h>
#include <neoflux/owner.h>
#include <neoflux/signal.h>
#include <neoflux/subscribers.h>
