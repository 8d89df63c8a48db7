#include "cli/cli.h"

int main(int argc, char **argv)
{
    if (argc < 2)
    {
        print_help(argv[0]);
        return 1;
    }

    CliOptions options;
    int status = parse_cli_args(argc, argv, options);
    if (status == 2)
    {
        return 0;
    }
    if (status != 0)
    {
        return status;
    }
    return compile_file(options);
}
