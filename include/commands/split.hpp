#pragma once

int cmd_split(int argc, char** argv);
