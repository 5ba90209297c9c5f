#pragma once

int cmd_list_types(int argc, char** argv);
