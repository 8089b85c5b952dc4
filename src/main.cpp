#include "config.hpp"
#include "download.hpp"
#include "metainfo_file.hpp"
#include "peer_channel.hpp"
#include "piece_manager.hpp"
#include "storage.hpp"
#include "utils.hpp"

#include <csignal>
#include <exception>
#include <iostream>
#include <optional>
#include <utility>
#include <vector>

static Download *g_download = nullptr;

extern "C" void on_interrupt(int /*signal*/)
{
	if (g_download != nullptr)
	{
		g_download->cancel();
	}
}

int main(int argc, char *argv[])
{
	if (argc < 3)
	{
		std::cout << "Usage: bitswarm path_to_torrent ip:port [ip:port...]" << '\n';
		return 1;
	}

	try
	{
		config::load_configs();
		config::create_downloads_dir();
	}
	catch (const std::exception &e)
	{
		std::cerr << "Failed to load configs: " << e.what() << '\n';
		return 1;
	}
	const config::Settings &settings = config::settings();

	std::vector<PeerAddress> peers;
	for (int i = 2; i < argc; ++i)
	{
		const auto address = PeerAddress::parse(argv[i]);
		if (!address.has_value())
		{
			std::cerr << "Invalid peer address: " << argv[i] << '\n';
			return 1;
		}
		peers.push_back(*address);
	}

	TorrentDescriptor descriptor;
	try
	{
		descriptor = load_metainfo_file(argv[1]);
	}
	catch (const InvalidMetainfo &e)
	{
		std::cerr << "Invalid torrent file: " << e.what() << '\n';
		return 1;
	}

	std::cout << "Name: " << descriptor.name.string() << '\n';
	if (!descriptor.announce.empty())
	{
		std::cout << "Announce: " << descriptor.announce << '\n';
	}
	std::cout << "Length: " << descriptor.total_length << " bytes in "
		  << descriptor.number_of_pieces() << " pieces" << '\n';
	std::cout << "Info hash: " << utils::to_hex(descriptor.info_hash) << '\n';

	FileStorage storage(descriptor, config::get_path_to_downloads_dir());
	try
	{
		storage.preallocate();
	}
	catch (const std::exception &e)
	{
		std::cerr << "Failed to prepare files: " << e.what() << '\n';
		return 1;
	}

	PieceManagerSettings piece_settings;
	piece_settings.request_timeout = settings.request_timeout;
	piece_settings.endgame_threshold = settings.endgame_threshold;
	piece_settings.max_endgame_holders = settings.max_endgame_holders;
	PieceManager pieces(descriptor, storage, piece_settings);

	StaticPeerSource source(std::move(peers));
	TcpConnector connector;
	Download download(descriptor, pieces, source, connector, settings);

	g_download = &download;
	std::signal(SIGINT, on_interrupt);
	std::signal(SIGTERM, on_interrupt);

	DownloadResult result = DownloadResult::CANCELLED;
	try
	{
		result = download.run();
	}
	catch (const std::exception &e)
	{
		std::cerr << "Download failed: " << e.what() << '\n';
		g_download = nullptr;
		return 1;
	}
	g_download = nullptr;

	std::cout << "Download " << to_string(result) << '\n';
	return result == DownloadResult::COMPLETED ? 0 : 2;
}
