#pragma once

#define ZEBRA_VERSION "0.4.1"

// Layout of the label export emitted by `zebra export --json`
#define ZEBRA_EXPORT_FORMAT_MAJOR 1
#define ZEBRA_EXPORT_FORMAT_MINOR 0
