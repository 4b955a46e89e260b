//
//  ebml_ids.hpp
//  CadenceFix
//
//  Created by Till Toenshoff on 10/18/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

namespace cadencefix {

// Known EBML/Matroska element identifiers. Values are the canonical identifiers with their
// VINT length-marker bits kept (e.g. Segment is 0x18538067).
enum class ElementId : uint32_t {
    AlphaMode = 0x53C0,
    AspectRatioType = 0x54B3,
    AttachedFile = 0x61A7,
    AttachmentLink = 0x7446,
    Attachments = 0x1941A469,
    Audio = 0xE1,
    BitDepth = 0x6264,
    Block = 0xA1,
    BlockAddID = 0xEE,
    BlockAdditional = 0xA5,
    BlockAdditionID = 0xCB,
    BlockAdditions = 0x75A1,
    BlockDuration = 0x9B,
    BlockGroup = 0xA0,
    BlockMore = 0xA6,
    BlockVirtual = 0xA2,
    ChannelPositions = 0x7D7B,
    Channels = 0x9F,
    ChapCountry = 0x437E,
    ChapLanguage = 0x437C,
    ChapProcess = 0x6944,
    ChapProcessCodecID = 0x6955,
    ChapProcessCommand = 0x6911,
    ChapProcessData = 0x6933,
    ChapProcessPrivate = 0x450D,
    ChapProcessTime = 0x6922,
    ChapString = 0x85,
    ChapterAtom = 0xB6,
    ChapterDisplay = 0x80,
    ChapterFlagEnabled = 0x4598,
    ChapterFlagHidden = 0x98,
    ChapterPhysicalEquiv = 0x63C3,
    Chapters = 0x1043A770,
    ChapterSegmentEditionUID = 0x6EBC,
    ChapterSegmentUID = 0x6E67,
    ChapterStringUID = 0x5654,
    ChapterTimeEnd = 0x92,
    ChapterTimeStart = 0x91,
    ChapterTrack = 0x8F,
    ChapterTrackNumber = 0x89,
    ChapterTranslate = 0x6924,
    ChapterTranslateCodec = 0x69BF,
    ChapterTranslateEditionUID = 0x69FC,
    ChapterTranslateID = 0x69A5,
    ChapterUID = 0x73C4,
    Cluster = 0x1F43B675,
    CodecDecodeAll = 0xAA,
    CodecDelay = 0x56AA,
    CodecDownloadURL = 0x26B240,
    CodecID = 0x86,
    CodecInfoURL = 0x3B4040,
    CodecName = 0x258688,
    CodecPrivate = 0x63A2,
    CodecSettings = 0x3A9697,
    CodecState = 0xA4,
    ColourSpace = 0x2EB524,
    ContentCompAlgo = 0x4254,
    ContentCompression = 0x5034,
    ContentCompSettings = 0x4255,
    ContentEncAlgo = 0x47E1,
    ContentEncKeyID = 0x47E2,
    ContentEncoding = 0x6240,
    ContentEncodingOrder = 0x5031,
    ContentEncodings = 0x6D80,
    ContentEncodingScope = 0x5032,
    ContentEncodingType = 0x5033,
    ContentEncryption = 0x5035,
    ContentSigAlgo = 0x47E5,
    ContentSigHashAlgo = 0x47E6,
    ContentSigKeyID = 0x47E4,
    ContentSignature = 0x47E3,
    CRC32 = 0xBF,
    CueBlockNumber = 0x5378,
    CueClusterPosition = 0xF1,
    CueCodecState = 0xEA,
    CueDuration = 0xB2,
    CuePoint = 0xBB,
    CueRefCluster = 0x97,
    CueRefCodecState = 0xEB,
    CueReference = 0xDB,
    CueRefNumber = 0x535F,
    CueRefTime = 0x96,
    CueRelativePosition = 0xF0,
    Cues = 0x1C53BB6B,
    CueTime = 0xB3,
    CueTrack = 0xF7,
    CueTrackPositions = 0xB7,
    DateUTC = 0x4461,
    DefaultDecodedFieldDuration = 0x234E7A,
    DefaultDuration = 0x23E383,
    Delay = 0xCE,
    DiscardPadding = 0x75A2,
    DisplayHeight = 0x54BA,
    DisplayUnit = 0x54B2,
    DisplayWidth = 0x54B0,
    DocType = 0x4282,
    DocTypeReadVersion = 0x4285,
    DocTypeVersion = 0x4287,
    Duration = 0x4489,
    EBML = 0x1A45DFA3,
    EBMLMaxIDLength = 0x42F2,
    EBMLMaxSizeLength = 0x42F3,
    EBMLReadVersion = 0x42F7,
    EBMLVersion = 0x4286,
    EditionEntry = 0x45B9,
    EditionFlagDefault = 0x45DB,
    EditionFlagHidden = 0x45BD,
    EditionFlagOrdered = 0x45DD,
    EditionUID = 0x45BC,
    EncryptedBlock = 0xAF,
    FileData = 0x465C,
    FileDescription = 0x467E,
    FileMimeType = 0x4660,
    FileName = 0x466E,
    FileReferral = 0x4675,
    FileUID = 0x46AE,
    FileUsedEndTime = 0x4662,
    FileUsedStartTime = 0x4661,
    FlagDefault = 0x88,
    FlagEnabled = 0xB9,
    FlagForced = 0x55AA,
    FlagInterlaced = 0x9A,
    FlagLacing = 0x9C,
    FrameNumber = 0xCD,
    FrameRate = 0x2383E3,
    GammaValue = 0x2FB523,
    Info = 0x1549A966,
    LaceNumber = 0xCC,
    Language = 0x22B59C,
    MaxBlockAdditionID = 0x55EE,
    MaxCache = 0x6DF8,
    MinCache = 0x6DE7,
    MuxingApp = 0x4D80,
    Name = 0x536E,
    NextFilename = 0x3E83BB,
    NextUID = 0x3EB923,
    OldStereoMode = 0x53B9,
    OutputSamplingFrequency = 0x78B5,
    PixelCropBottom = 0x54AA,
    PixelCropLeft = 0x54CC,
    PixelCropRight = 0x54DD,
    PixelCropTop = 0x54BB,
    PixelHeight = 0xBA,
    PixelWidth = 0xB0,
    Position = 0xA7,
    PrevFilename = 0x3C83AB,
    PrevSize = 0xAB,
    PrevUID = 0x3CB923,
    ReferenceBlock = 0xFB,
    ReferenceFrame = 0xC8,
    ReferenceOffset = 0xC9,
    ReferencePriority = 0xFA,
    ReferenceTimeCode = 0xCA,
    ReferenceVirtual = 0xFD,
    SamplingFrequency = 0xB5,
    Seek = 0x4DBB,
    SeekHead = 0x114D9B74,
    SeekID = 0x53AB,
    SeekPosition = 0x53AC,
    SeekPreRoll = 0x56BB,
    Segment = 0x18538067,
    SegmentFamily = 0x4444,
    SegmentFilename = 0x7384,
    SegmentUID = 0x73A4,
    Signature = 0x7EB5,
    SignatureAlgo = 0x7E8A,
    SignatureElementList = 0x7E7B,
    SignatureElements = 0x7E5B,
    SignatureHash = 0x7E9A,
    SignaturePublicKey = 0x7EA5,
    SignatureSlot = 0x1B538667,
    SignedElement = 0x6532,
    SilentTrackNumber = 0x58D7,
    SilentTracks = 0x5854,
    SimpleBlock = 0xA3,
    SimpleTag = 0x67C8,
    SliceDuration = 0xCF,
    Slices = 0x8E,
    StereoMode = 0x53B8,
    Tag = 0x7373,
    TagAttachmentUID = 0x63C6,
    TagBinary = 0x4485,
    TagChapterUID = 0x63C4,
    TagDefault = 0x4484,
    TagEditionUID = 0x63C9,
    TagLanguage = 0x447A,
    TagName = 0x45A3,
    Tags = 0x1254C367,
    TagString = 0x4487,
    TagTrackUID = 0x63C5,
    Targets = 0x63C0,
    TargetType = 0x63CA,
    TargetTypeValue = 0x68CA,
    Timecode = 0xE7,
    TimecodeScale = 0x2AD7B1,
    TimecodeScaleDenominator = 0x2AD7B2,
    TimeSlice = 0xE8,
    Title = 0x7BA9,
    TrackCombinePlanes = 0xE3,
    TrackEntry = 0xAE,
    TrackJoinBlocks = 0xE9,
    TrackJoinUID = 0xED,
    TrackNumber = 0xD7,
    TrackOffset = 0x537F,
    TrackOperation = 0xE2,
    TrackOverlay = 0x6FAB,
    TrackPlane = 0xE4,
    TrackPlaneType = 0xE6,
    TrackPlaneUID = 0xE5,
    Tracks = 0x1654AE6B,
    TrackTimecodeScale = 0x23314F,
    TrackTranslate = 0x6624,
    TrackTranslateCodec = 0x66BF,
    TrackTranslateEditionUID = 0x66FC,
    TrackTranslateTrackID = 0x66A5,
    TrackType = 0x83,
    TrackUID = 0x73C5,
    TrickMasterTrackSegmentUID = 0xC4,
    TrickMasterTrackUID = 0xC7,
    TrickTrackFlag = 0xC6,
    TrickTrackSegmentUID = 0xC1,
    TrickTrackUID = 0xC0,
    Video = 0xE0,
    Void = 0xEC,
    WritingApp = 0x5741,
};

// Resolve a raw identifier against the closed schema. std::nullopt means the identifier is not
// part of the vocabulary; callers treat that as a hard decode error.
std::optional<ElementId> lookup_element_id(uint32_t raw_id);

// Symbolic name as used in the Matroska registry ("SimpleBlock", "CRC-32", ...).
const char *element_name(ElementId id);

// Number of entries in the schema table.
size_t element_table_size();

}  // namespace cadencefix
