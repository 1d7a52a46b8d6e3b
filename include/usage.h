#pragma once

void print_usage(bool print_version = true);
void print_version();
