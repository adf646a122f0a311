#pragma once

#define MUTSEL_VERSION "0.4.0"
